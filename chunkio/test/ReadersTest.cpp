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

#include <fmt/format.h>

#include <chunkio/ErrorCode.h>
#include <chunkio/HarpDecoder.h>
#include <chunkio/Readers.h>
#include <chunkio/os/Utils.h>
#include <chunkio/test/helpers/DatasetBuilder.h>

using namespace std;
using namespace chunkio;
using namespace chunkio::test;

namespace pt = boost::posix_time;

namespace {

const uint8_t kU8 = static_cast<uint8_t>(harp::PayloadType::U8);

string seconds(const Time& time) {
  return fmt::format("{}", toSeconds(time));
}

struct ReadersTest : testing::Test {
  void SetUp() override {
    kRoot = makeTestFolder("readers_test");
  }

  string path(const string& name) const {
    return os::pathJoin(kRoot, name);
  }

  string kRoot;
};

} // namespace

TEST_F(ReadersTest, csv) {
  const string file = path("state.csv");
  ASSERT_EQ(
      writeTextFile(
          file,
          fmt::format(
              "Seconds,Value\n{},Maintenance\n{},Experiment\n",
              seconds(makeTime(10)),
              seconds(makeTime(10, 0, 1.5)))),
      0);
  CsvReader reader("Environment_EnvironmentState_*", {"state"});
  EXPECT_EQ(reader.getType(), ReaderType::Csv);
  EXPECT_EQ(reader.getExtension(), "csv");
  Table table;
  ASSERT_EQ(reader.read(file, table), 0);
  ASSERT_EQ(table.size(), 2);
  EXPECT_EQ(table.getColumns(), (vector<string>{"state"}));
  EXPECT_EQ(table.getTime(1), makeTime(10) + pt::milliseconds(1500));
  EXPECT_EQ(table.get(0, "state"), Value("Maintenance"));
}

TEST_F(ReadersTest, csvCellTypes) {
  const string file = path("subject.csv");
  ASSERT_EQ(
      writeTextFile(
          file,
          fmt::format(
              "time,id,weight,event\r\n{0},BAA-1,25.5,Enter\r\n{0},BAA-1,,Exit\r\n{0},7,True,x\r\n",
              seconds(makeTime(10)))),
      0);
  Table table;
  ASSERT_EQ(makeSubjectReader("Environment_SubjectState_*")->read(file, table), 0);
  ASSERT_EQ(table.size(), 3);
  EXPECT_EQ(table.getColumns(), (vector<string>{"id", "weight", "event"}));
  EXPECT_EQ(table.get(0, "weight"), Value(25.5));
  EXPECT_TRUE(table.get(1, "weight").isMissing());
  EXPECT_EQ(table.get(1, "event"), Value("Exit"));
  EXPECT_TRUE(table.get(2, "id").isInt());
  EXPECT_EQ(table.get(2, "weight").getType(), Value::Type::Bool);
}

TEST_F(ReadersTest, csvQuotedFields) {
  const string file = path("log.csv");
  ASSERT_EQ(
      writeTextFile(
          file,
          fmt::format(
              "time,priority,type,message\n{},Alert,Info,\"hello, \"\"world\"\"\"\n",
              seconds(makeTime(10)))),
      0);
  Table table;
  ASSERT_EQ(makeLogReader("Environment_MessageLog_*")->read(file, table), 0);
  ASSERT_EQ(table.size(), 1);
  EXPECT_EQ(table.get(0, "message"), Value("hello, \"world\""));
}

TEST_F(ReadersTest, csvFirstColumnIsTime) {
  const string file = path("named.csv");
  ASSERT_EQ(writeTextFile(file, fmt::format("a,b\n{},3\n", seconds(makeTime(10)))), 0);
  Table table;
  ASSERT_EQ(CsvReader("Named_*", {"time", "x"}).read(file, table), 0);
  EXPECT_EQ(table.getColumns(), (vector<string>{"x"}));
  EXPECT_EQ(table.get(0, "x"), Value(3));
}

TEST_F(ReadersTest, csvEmptyFiles) {
  CsvReader reader("Named_*", {"time", "x"});
  Table table;
  ASSERT_EQ(writeTextFile(path("empty.csv"), ""), 0);
  ASSERT_EQ(reader.read(path("empty.csv"), table), 0);
  EXPECT_TRUE(table.empty());
  EXPECT_FALSE(table.hasTimeIndex());
  EXPECT_EQ(table.getColumns(), (vector<string>{"time", "x"}));

  ASSERT_EQ(writeTextFile(path("header.csv"), "a,b\n"), 0);
  ASSERT_EQ(reader.read(path("header.csv"), table), 0);
  EXPECT_TRUE(table.empty());
  EXPECT_TRUE(table.hasTimeIndex());
  EXPECT_EQ(table.getColumns(), (vector<string>{"x"}));

  // a header with a time field keeps all the declared columns
  ReaderPtr subjects = makeSubjectReader("Environment_SubjectState_*");
  ASSERT_EQ(writeTextFile(path("subjects.csv"), "time,id,weight,event\n"), 0);
  ASSERT_EQ(subjects->read(path("subjects.csv"), table), 0);
  EXPECT_TRUE(table.empty());
  EXPECT_EQ(table.getColumns(), (vector<string>{"id", "weight", "event"}));

  ASSERT_EQ(writeTextFile(path("blank.csv"), "\n"), 0);
  ASSERT_EQ(reader.read(path("blank.csv"), table), 0);
  EXPECT_FALSE(table.hasTimeIndex());

  ASSERT_EQ(writeTextFile(path("wide_header.csv"), "a,b,c,d\n"), 0);
  EXPECT_EQ(reader.read(path("wide_header.csv"), table), CSV_PARSE_ERROR);
}

TEST_F(ReadersTest, csvErrors) {
  CsvReader reader("Named_*", {"x"});
  Table table;
  ASSERT_EQ(writeTextFile(path("ragged.csv"), "a,b\n1,2\n3,4,5\n"), 0);
  EXPECT_EQ(reader.read(path("ragged.csv"), table), CSV_PARSE_ERROR);
  ASSERT_EQ(writeTextFile(path("badtime.csv"), "a,b\nnoon,2\n"), 0);
  EXPECT_EQ(reader.read(path("badtime.csv"), table), CSV_PARSE_ERROR);
  ASSERT_EQ(writeTextFile(path("wide.csv"), "a,b,c,d\n1,2,3,4\n"), 0);
  EXPECT_EQ(reader.read(path("wide.csv"), table), CSV_PARSE_ERROR);
  EXPECT_NE(reader.read(path("missing.csv"), table), 0);
}

TEST_F(ReadersTest, jsonList) {
  const string file = path("events.jsonl");
  ASSERT_EQ(
      writeTextFile(
          file,
          fmt::format(
              "{{\"seconds\": {}, \"value\": {{\"x\": 1, \"y\": \"up\"}}}}\n\n"
              "{{\"seconds\": {}, \"value\": {{\"x\": 2.5, \"y\": \"down\"}}, \"extra\": true}}\n",
              seconds(makeTime(10)),
              seconds(makeTime(10, 1)))),
      0);
  JsonListReader reader("Rfid_Events_*", {"x", "y"});
  EXPECT_EQ(reader.getExtension(), "jsonl");
  EXPECT_EQ(reader.getRootKey(), "value");
  Table table;
  ASSERT_EQ(reader.read(file, table), 0);
  ASSERT_EQ(table.size(), 2);
  EXPECT_EQ(table.getTime(1), makeTime(10, 1));
  EXPECT_EQ(table.get(0, "x"), Value(1));
  EXPECT_EQ(table.get(1, "x"), Value(2.5));
  EXPECT_EQ(table.get(1, "y"), Value("down"));
  EXPECT_TRUE(table.get(1, "value").isMap());
  EXPECT_TRUE(table.get(0, "extra").isMissing());
  EXPECT_EQ(table.get(1, "extra"), Value(true));

  JsonListReader missingKey("Rfid_Events_*", {"z"});
  EXPECT_EQ(missingKey.read(file, table), JSON_PARSE_ERROR);
  JsonListReader otherRoot("Rfid_Events_*", {"x"}, "payload");
  EXPECT_EQ(otherRoot.read(file, table), JSON_PARSE_ERROR);
}

TEST_F(ReadersTest, jsonListEdgeCases) {
  JsonListReader reader("Rfid_Events_*", {"x"});
  Table table;
  ASSERT_EQ(writeTextFile(path("empty.jsonl"), ""), 0);
  ASSERT_EQ(reader.read(path("empty.jsonl"), table), 0);
  EXPECT_TRUE(table.empty());
  EXPECT_EQ(table.getColumns(), (vector<string>{"x"}));

  ASSERT_EQ(writeTextFile(path("bad.jsonl"), "{\"seconds\": 1, \n"), 0);
  EXPECT_EQ(reader.read(path("bad.jsonl"), table), JSON_PARSE_ERROR);
  ASSERT_EQ(writeTextFile(path("untimed.jsonl"), "{\"value\": {\"x\": 1}}\n"), 0);
  EXPECT_EQ(reader.read(path("untimed.jsonl"), table), JSON_PARSE_ERROR);
}

TEST_F(ReadersTest, bitmaskEvent) {
  const string file = path("beam.bin");
  ASSERT_EQ(
      writeHarpFile(
          file,
          kU8,
          {{makeTime(10), {0x22}}, {makeTime(10, 0, 1), {0x02}}, {makeTime(10, 0, 2), {0x23}}}),
      0);
  BitmaskEventReader reader("Patch1_32_*", 0x22, "PelletDetected");
  EXPECT_EQ(reader.getType(), ReaderType::BitmaskEvent);
  Table table;
  ASSERT_EQ(reader.read(file, table), 0);
  ASSERT_EQ(table.size(), 2);
  EXPECT_EQ(table.getColumns(), (vector<string>{"event"}));
  EXPECT_EQ(table.getTime(1), makeTime(10, 0, 2));
  EXPECT_EQ(table.get(0, "event"), Value("PelletDetected"));
}

TEST_F(ReadersTest, digitalBitmask) {
  const string file = path("digital.bin");
  vector<HarpMessage> messages;
  const vector<double> states{1, 3, 2, 0, 1};
  for (size_t k = 0; k < states.size(); ++k) {
    messages.push_back({makeTime(10, 0, static_cast<double>(k)), {states[k]}});
  }
  ASSERT_EQ(writeHarpFile(file, kU8, messages), 0);
  DigitalBitmaskReader reader("Patch1_35_*", 0x1, {"state"});
  Table table;
  ASSERT_EQ(reader.read(file, table), 0);
  // 1, 1, 0, 0, 1: only changes are kept
  ASSERT_EQ(table.size(), 3);
  EXPECT_EQ(table.getTime(1), makeTime(10, 0, 2));
  EXPECT_EQ(table.get(0, "state"), Value(true));
  EXPECT_EQ(table.get(1, "state"), Value(false));
  EXPECT_EQ(table.get(2, "state"), Value(true));
}

TEST_F(ReadersTest, fixedLayoutHarpReaders) {
  EXPECT_EQ(makeHeartbeatReader("Patch1_8_*")->getColumns(), (vector<string>{"second"}));
  EXPECT_EQ(
      makeEncoderReader("Patch1_90_*")->getColumns(), (vector<string>{"angle", "intensity"}));
  ReaderPtr position = makePositionReader("CameraTop_200_*");
  EXPECT_EQ(position->getColumns().size(), 7);
  EXPECT_EQ(position->getExtension(), "bin");

  const string file = path("position.bin");
  ASSERT_EQ(
      writeHarpFile(
          file,
          static_cast<uint8_t>(harp::PayloadType::Float),
          {{makeTime(10), {1, 2, 0.5, 10, 5, 100, 0}}}),
      0);
  Table table;
  ASSERT_EQ(position->read(file, table), 0);
  EXPECT_EQ(table.get(0, "area"), Value(100));
}

TEST_F(ReadersTest, chunk) {
  const string file = getChunkPath(kRoot, kTestEpoch, "Patch1", "8", makeTime(10), "bin");
  ASSERT_EQ(writeHarpFile(file, kU8, {{makeTime(10, 5), {1}}}), 0);
  ChunkReader reader(*makeHeartbeatReader("Patch1_8_*"));
  EXPECT_EQ(reader.getPattern(), "Patch1_8_*");
  EXPECT_EQ(reader.getExtension(), "bin");
  Table table;
  ASSERT_EQ(reader.read(file, table), 0);
  ASSERT_EQ(table.size(), 1);
  EXPECT_EQ(table.getTime(0), makeTime(10));
  EXPECT_EQ(table.get(0, "path"), Value(file));
  EXPECT_EQ(table.get(0, "epoch"), Value(kTestEpoch));
  EXPECT_EQ(reader.read(path("Patch1_8_nodate.bin"), table), FILEPATH_PARSE_ERROR);
}

TEST_F(ReadersTest, metadata) {
  ASSERT_EQ(writeMetadata(kRoot, kTestEpoch, "Experiment0.2.bonsai", "abc123"), 0);
  MetadataReader reader;
  EXPECT_EQ(reader.getPattern(), "Metadata");
  EXPECT_EQ(reader.getExtension(), "yml");
  Table table;
  ASSERT_EQ(reader.read(os::pathJoin(kRoot, kTestEpoch, "Metadata.yml"), table), 0);
  ASSERT_EQ(table.size(), 1);
  EXPECT_EQ(table.getTime(0), makeTime(0));
  EXPECT_EQ(table.get(0, "workflow"), Value("Experiment0.2.bonsai"));
  EXPECT_EQ(table.get(0, "commit"), Value("abc123"));
  EXPECT_EQ(table.get(0, "epoch"), Value(kTestEpoch));
  const Value& metadata = table.get(0, "metadata");
  ASSERT_TRUE(metadata.isMap());
  EXPECT_EQ(metadata.getMap().size(), 1);
  EXPECT_EQ(metadata.getMap().at("Devices").getMap().at("Patch1").getMap().at("Rate"), Value(50));
}

TEST_F(ReadersTest, metadataErrors) {
  const string epoch = "2024-01-03T00-00-00";
  const string file = os::pathJoin(kRoot, epoch, "Metadata.yml");
  ASSERT_EQ(writeTextFile(file, "{\"Commit\": \"abc\"}"), 0);
  Table table;
  EXPECT_EQ(MetadataReader().read(file, table), CONFIG_MISSING_KEY);

  ASSERT_EQ(writeTextFile(file, "{\"Workflow\": \"w.bonsai\"}"), 0);
  ASSERT_EQ(MetadataReader().read(file, table), 0);
  EXPECT_TRUE(table.get(0, "commit").isMissing());

  const string undated = os::pathJoin(kRoot, "Metadata.yml");
  ASSERT_EQ(writeTextFile(undated, "{\"Workflow\": \"w.bonsai\"}"), 0);
  EXPECT_EQ(MetadataReader().read(undated, table), FILEPATH_PARSE_ERROR);
}

TEST_F(ReadersTest, video) {
  const string csvFile =
      os::pathJoin(kRoot, kTestEpoch, "CameraTop", "CameraTop_2024-01-01T10-00-00.csv");
  ASSERT_EQ(
      writeTextFile(
          csvFile,
          fmt::format(
              "Seconds,HwCounter,HwTimestamp\n{},100,5000\n{},101,5020\n",
              seconds(makeTime(10)),
              seconds(makeTime(10, 0, 0.5)))),
      0);
  VideoReader reader("CameraTop_*");
  EXPECT_EQ(reader.getType(), ReaderType::Video);
  Table table;
  ASSERT_EQ(reader.read(csvFile, table), 0);
  ASSERT_EQ(table.size(), 2);
  EXPECT_EQ(table.getColumns(), reader.getColumns());
  EXPECT_EQ(table.get(1, "hw_counter"), Value(101));
  EXPECT_EQ(table.get(1, "_frame"), Value(1));
  EXPECT_EQ(table.get(0, "_path"), Value(os::replaceExtension(csvFile, ".avi")));
  EXPECT_EQ(table.get(0, "_epoch"), Value(kTestEpoch));
}

TEST_F(ReadersTest, readerTypeNames) {
  EXPECT_STREQ(toString(ReaderType::Harp), "Harp");
  EXPECT_STREQ(toString(ReaderType::JsonList), "JsonList");
  EXPECT_STREQ(toString(ReaderType::Pose), "Pose");
}
