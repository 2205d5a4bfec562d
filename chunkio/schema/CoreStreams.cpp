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

#include "CoreStreams.h"

#include <chunkio/PoseReader.h>
#include <chunkio/Readers.h>

using namespace std;

namespace chunkio {
namespace schema {

unique_ptr<StreamSet> heartbeat(const string& pattern) {
  return make_unique<Stream>("Heartbeat", makeHeartbeatReader(pattern + "_8_*"));
}

unique_ptr<StreamSet> video(const string& pattern) {
  return make_unique<Stream>("Video", make_shared<VideoReader>(pattern + "_*"));
}

unique_ptr<StreamSet> position(const string& pattern) {
  return make_unique<Stream>("Position", makePositionReader(pattern + "_200_*"));
}

unique_ptr<StreamSet> encoder(const string& pattern) {
  return make_unique<Stream>("Encoder", makeEncoderReader(pattern + "_90_*"));
}

unique_ptr<StreamSet> environmentState(const string& pattern) {
  return make_unique<Stream>(
      "EnvironmentState",
      make_shared<CsvReader>(pattern + "_EnvironmentState_*", vector<string>{"state"}));
}

unique_ptr<StreamSet> subjectState(const string& pattern) {
  return make_unique<Stream>("SubjectState", makeSubjectReader(pattern + "_SubjectState_*"));
}

unique_ptr<StreamSet> messageLog(const string& pattern) {
  return make_unique<Stream>("MessageLog", makeLogReader(pattern + "_MessageLog_*"));
}

unique_ptr<StreamSet> metadata(const string& pattern) {
  return make_unique<Stream>("Metadata", make_shared<MetadataReader>(pattern));
}

unique_ptr<StreamSet> pose(const string& pattern) {
  return make_unique<Stream>("Pose", make_shared<PoseReader>(pattern + "_202_*"));
}

unique_ptr<StreamSet> environment(const string& pattern) {
  return make_unique<StreamGroup>(
      "Environment", pattern, vector<StreamFactory>{environmentState, subjectState});
}

} // namespace schema
} // namespace chunkio
