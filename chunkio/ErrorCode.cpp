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

#include <chunkio/ErrorCode.h>

#include <map>

#include <fmt/format.h>

#include <chunkio/os/Utils.h>

using namespace std;
using namespace chunkio;

namespace {
const char* getSimpleErrorName(int errorCode) {
  static const map<int, const char*> sRegistry = {
      {SUCCESS, "Success"},
      {FAILURE, "Misc error"},
      {NOT_SUPPORTED, "Operation not supported"},
      {INVALID_PARAMETER, "Invalid parameter"},
      {FILE_NOT_FOUND, "File not found"},
      {READ_ERROR, "Read error: failed to read data"},
      {FILEPATH_PARSE_ERROR, "Could not parse filepath"},

      {JSON_PARSE_ERROR, "Could not parse json document"},
      {CSV_PARSE_ERROR, "Could not parse delimited text"},
      {FRAME_DECODE_ERROR, "Binary frame decode error"},
      {COLUMN_COUNT_MISMATCH, "Column count does not match the data layout"},

      {CONFIG_NOT_FOUND, "Model config not found"},
      {CONFIG_UNSUPPORTED, "Unsupported model config"},
      {CONFIG_MISSING_KEY, "Model config is missing a required key"},

      {INDEX_LOOKUP_ERROR, "Time bound not found in data index"},
  };
  auto iter = sRegistry.find(errorCode);
  return iter != sRegistry.end() ? iter->second : nullptr;
}
} // namespace

namespace chunkio {

string errorCodeToMessage(int errorCode) {
  if (errorCode < 0 || (errorCode > 0 && errorCode < kPlatformUserErrorsStart)) {
    return os::fileErrorToString(errorCode);
  }
  const char* errorName = getSimpleErrorName(errorCode);
  if (errorName != nullptr) {
    return errorName;
  }
  return fmt::format("<Unknown error code '{}'>", errorCode);
}

string errorCodeToMessageWithCode(int errorCode) {
  return errorCodeToMessage(errorCode) + " (#" + to_string(errorCode) + ")";
}

} // namespace chunkio
