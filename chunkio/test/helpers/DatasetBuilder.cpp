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

#include <chunkio/test/helpers/DatasetBuilder.h>

#include <fmt/format.h>

#include <chunkio/HarpDecoder.h>
#include <chunkio/helpers/FileMacros.h>
#include <chunkio/os/Utils.h>

using namespace std;

namespace pt = boost::posix_time;

namespace chunkio {
namespace test {

namespace {

int makeParentFolder(const string& path) {
  string parent = os::getParentFolder(path);
  return parent.empty() || os::isDir(parent) ? 0 : os::makeDirectories(parent);
}

string jsonStringList(const vector<string>& strings) {
  string list = "[";
  for (size_t k = 0; k < strings.size(); ++k) {
    list += fmt::format("{}\"{}\"", k > 0 ? ", " : "", strings[k]);
  }
  return list + "]";
}

} // namespace

string makeTestFolder(const string& name) {
  string folder = os::pathJoin(os::getTempFolder(), "chunkio_tests", name);
  if (os::pathExists(folder)) {
    os::remove(folder);
  }
  os::makeDirectories(folder);
  return folder;
}

Time makeTime(int hour, int minute, double second) {
  Time epoch;
  parseDateTime(kTestEpoch, epoch);
  return epoch + pt::hours(hour) + pt::minutes(minute) +
      pt::microseconds(static_cast<int64_t>(second * 1e6 + 0.5));
}

string getChunkPath(
    const string& root,
    const string& epoch,
    const string& device,
    const string& stream,
    const Time& chunk,
    const string& extension) {
  string fileName =
      fmt::format("{}_{}_{}.{}", device, stream, formatChunkTime(chunk), extension);
  return os::pathJoin(root, epoch, device, fileName);
}

int writeHarpFile(const string& path, uint8_t payloadType, const vector<HarpMessage>& messages) {
  vector<uint8_t> buffer;
  for (const HarpMessage& message : messages) {
    harp::encodeMessage(buffer, payloadType, toSeconds(message.time), message.payload);
  }
  IF_ERROR_RETURN(makeParentFolder(path));
  return os::writeFile(path, buffer.data(), buffer.size());
}

int writeTextFile(const string& path, const string& content) {
  IF_ERROR_RETURN(makeParentFolder(path));
  return os::writeFile(path, content);
}

int writeMetadata(
    const string& root,
    const string& epoch,
    const string& workflow,
    const string& commit) {
  string content = fmt::format(
      "{{\"Workflow\": \"{}\", \"Commit\": \"{}\", \"Devices\": {{\"Patch1\": {{\"Rate\": 50}}}}}}",
      workflow,
      commit);
  return writeTextFile(os::pathJoin(root, epoch, "Metadata.yml"), content);
}

int writePoseConfig(
    const string& dir,
    const vector<string>& classes,
    const string& anchorPart,
    const vector<string>& partNames) {
  string classVectors;
  if (!classes.empty()) {
    classVectors = fmt::format(", \"class_vectors\": {{\"classes\": {}}}", jsonStringList(classes));
  }
  string content = fmt::format(
      "{{\"model\": {{\"heads\": {{\"single_instance\": null, \"multi_class_topdown\": "
      "{{\"confmaps\": {{\"anchor_part\": \"{}\", \"part_names\": {}, \"sigma\": 1.5}}{}}}}}}}}}",
      anchorPart,
      jsonStringList(partNames),
      classVectors);
  return writeTextFile(os::pathJoin(dir, "confmap_config.json"), content);
}

} // namespace test
} // namespace chunkio
