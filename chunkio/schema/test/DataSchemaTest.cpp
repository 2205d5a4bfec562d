/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include <chunkio/HarpDecoder.h>
#include <chunkio/Loader.h>
#include <chunkio/Readers.h>
#include <chunkio/Time.h>
#include <chunkio/os/Utils.h>
#include <chunkio/schema/DataSchema.h>
#include <chunkio/test/helpers/DatasetBuilder.h>

using namespace std;
using namespace chunkio;
using namespace chunkio::schema;

namespace {

ReaderFactory makeEvents() {
  return [](const string& prefix) { return makeHeartbeatReader(prefix + "_32_*"); };
}

} // namespace

TEST(DataSchemaTest, nodeKinds) {
  EXPECT_STREQ(toString(NodeKind::Dataset), "Dataset");
  EXPECT_STREQ(toString(NodeKind::Device), "Device");
  EXPECT_STREQ(toString(NodeKind::Module), "Module");
}

TEST(DataSchemaTest, devicePrefix) {
  SchemaNode root;
  EXPECT_EQ(root.getKind(), NodeKind::Dataset);
  EXPECT_EQ(root.getParent(), nullptr);
  EXPECT_EQ(root.getPrefix(), "");

  SchemaNode& device = root.addField("dummy_device", NodeKind::Device);
  EXPECT_EQ(device.getName(), "DummyDevice");
  EXPECT_EQ(device.getParent(), &root);
  device.addReader("Events", makeEvents());
  ReaderPtr reader = device.getReader("Events");
  ASSERT_TRUE(reader);
  EXPECT_EQ(reader->getPattern(), "DummyDevice_32_*");
  EXPECT_EQ(root.getChild("DummyDevice"), &device);
  EXPECT_EQ(root.getChild("dummy_device"), nullptr);
}

TEST(DataSchemaTest, nestedDataset) {
  SchemaNode root;
  SchemaNode& nested = root.addField("nested_data", NodeKind::Dataset);
  SchemaNode& device = nested.addField("nested_device", NodeKind::Device);
  device.addReader("Events", makeEvents());
  EXPECT_EQ(nested.getPrefix(), "NestedData");
  EXPECT_EQ(device.getReader("Events")->getPattern(), "NestedData/NestedDevice_32_*");
}

TEST(DataSchemaTest, modules) {
  SchemaNode root;
  SchemaNode& camera = root.addField("camera", NodeKind::Device);
  SchemaNode& tracking = camera.addField("pose_tracking", NodeKind::Module);
  tracking.addReader("Pose", [](const string& prefix) {
    return makePositionReader(prefix + "_202_*");
  });
  EXPECT_EQ(tracking.getName(), "PoseTracking");
  EXPECT_EQ(tracking.getPrefix(), "Camera");
  EXPECT_EQ(tracking.getReader("Pose")->getPattern(), "Camera_202_*");

  // devices inside a module still belong to the dataset
  SchemaNode& sensor = tracking.addField("sensor", NodeKind::Device);
  EXPECT_EQ(sensor.getPrefix(), "Sensor");
}

TEST(DataSchemaTest, entries) {
  SchemaNode root;
  SchemaNode& feeders = root.addField("feeders", NodeKind::Module);
  for (const char* key : {"Feeder1", "Feeder2"}) {
    feeders.addEntry(key, NodeKind::Device).addReader("Events", makeEvents());
  }
  ASSERT_EQ(feeders.getChildren().size(), 2);
  SchemaNode* feeder = feeders.getChild("Feeder1");
  ASSERT_NE(feeder, nullptr);
  EXPECT_EQ(feeder->getReader("Events")->getPattern(), "Feeder1_32_*");

  SchemaNode& lightCycle = root.addEntry("light_cycle", NodeKind::Device);
  EXPECT_EQ(lightCycle.getName(), "light_cycle");
  lightCycle.addReader("Events", [](const string& prefix) {
    return makeLogReader(prefix + "_Events_*");
  });
  EXPECT_EQ(lightCycle.getReader("Events")->getPattern(), "light_cycle_Events_*");
}

TEST(DataSchemaTest, existingChild) {
  SchemaNode root;
  SchemaNode& device = root.addField("patch", NodeKind::Device);
  EXPECT_EQ(&root.addField("patch", NodeKind::Device), &device);
  EXPECT_EQ(&root.addEntry("Patch", NodeKind::Device), &device);
  EXPECT_EQ(root.getChildren().size(), 1);
}

TEST(DataSchemaTest, lazyReaders) {
  SchemaNode root;
  SchemaNode& device = root.addField("patch1", NodeKind::Device);
  int calls = 0;
  device.addReader("Events", [&calls](const string& prefix) {
    ++calls;
    return makeHeartbeatReader(prefix + "_32_*");
  });
  device.addReader("Encoder", [](const string& prefix) {
    return makeEncoderReader(prefix + "_90_*");
  });
  EXPECT_EQ(device.getReaderNames(), (vector<string>{"Encoder", "Events"}));
  EXPECT_EQ(calls, 0);
  ReaderPtr first = device.getReader("Events");
  ReaderPtr second = device.getReader("Events");
  EXPECT_EQ(first, second);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(device.getReader("Missing"), nullptr);

  // redeclaring a reader drops the one created
  device.addReader("Events", makeEvents());
  EXPECT_NE(device.getReader("Events"), first);
  EXPECT_EQ(calls, 1);
}

TEST(DataSchemaTest, loadDeclaredStream) {
  using namespace chunkio::test;
  const string root = makeTestFolder("data_schema_load");
  SchemaNode schema;
  SchemaNode& patch = schema.addField("patch1", NodeKind::Device);
  patch.addReader("Heartbeat", [](const string& prefix) {
    return makeHeartbeatReader(prefix + "_8_*");
  });
  SchemaNode& nested = schema.addField("arena", NodeKind::Dataset);
  nested.addField("patch2", NodeKind::Device).addReader("Heartbeat", [](const string& prefix) {
    return makeHeartbeatReader(prefix + "_8_*");
  });

  const uint8_t kU32 = static_cast<uint8_t>(harp::PayloadType::U32);
  ASSERT_EQ(
      writeHarpFile(
          getChunkPath(root, kTestEpoch, "Patch1", "8", makeTime(10), "bin"),
          kU32,
          {{makeTime(10, 0, 1), {1}}, {makeTime(10, 0, 2), {2}}}),
      0);
  ASSERT_EQ(
      writeHarpFile(
          os::pathJoin(root, kTestEpoch, "Arena", "Patch2_8_" + formatChunkTime(makeTime(10)))
              + ".bin",
          kU32,
          {{makeTime(10, 0, 3), {3}}}),
      0);

  Table table;
  ASSERT_EQ(load(root, *patch.getReader("Heartbeat"), {}, table), 0);
  ASSERT_EQ(table.size(), 2);
  EXPECT_EQ(table.get(1, "second"), Value(2));

  ReaderPtr nestedReader = nested.getChild("Patch2")->getReader("Heartbeat");
  EXPECT_EQ(nestedReader->getPattern(), "Arena/Patch2_8_*");
  ASSERT_EQ(load(root, *nestedReader, {}, table), 0);
  ASSERT_EQ(table.size(), 1);
  EXPECT_EQ(table.get(0, "second"), Value(3));

  // the dataset folder is part of the pattern
  ASSERT_EQ(load(root, *makeHeartbeatReader("Patch1/Patch2_8_*"), {}, table), 0);
  EXPECT_TRUE(table.empty());
}
