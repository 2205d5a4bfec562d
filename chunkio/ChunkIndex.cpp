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

#include "ChunkIndex.h"

#define DEFAULT_LOG_CHANNEL "ChunkIndex"
#include <logging/Log.h>

#include <chunkio/ErrorCode.h>
#include <chunkio/helpers/FileMacros.h>
#include <chunkio/helpers/Strings.h>
#include <chunkio/os/FileList.h>
#include <chunkio/os/Utils.h>

using namespace std;

namespace chunkio {

namespace {

// Split "<date>T<time>" in exactly two parts.
bool splitDateTime(const string& text, string& outDate, string& outTime) {
  vector<string> parts;
  if (helpers::split(text, 'T', parts) != 2) {
    return false;
  }
  outDate = parts[0];
  outTime = parts[1];
  return true;
}

// Patterns may have folder segments, "Folder/Device_*", matched against the last path parts.
bool matchesFileSpec(const vector<string>& relativeParts, const ChunkFileSpec& spec) {
  vector<string> segments;
  helpers::split(spec.pattern + '.' + spec.extension, '/', segments, true);
  if (segments.empty() || relativeParts.size() < segments.size()) {
    return false;
  }
  if (!spec.epochPattern.empty() &&
      (relativeParts.size() < segments.size() + 1 ||
       !helpers::matchWildcard(spec.epochPattern, relativeParts[0]))) {
    return false;
  }
  const size_t offset = relativeParts.size() - segments.size();
  for (size_t k = 0; k < segments.size(); ++k) {
    if (!helpers::matchWildcard(segments[k], relativeParts[offset + k])) {
      return false;
    }
  }
  return true;
}

} // namespace

int getChunkKey(const string& path, ChunkKey& outKey) {
  vector<string> parts = os::getPathParts(path);
  string stem = os::getFileStem(path);
  size_t separator = stem.rfind('_');
  string chunkName = separator == string::npos ? stem : stem.substr(separator + 1);
  string date, time;
  Time chunk;
  if (parts.size() >= 3 && splitDateTime(chunkName, date, time) &&
      parseDateTime(date, time, chunk)) {
    outKey = ChunkKey(parts[parts.size() - 3], chunk);
    return SUCCESS;
  }
  // not chunked: the parent folder names the epoch
  if (parts.size() >= 2) {
    const string& epoch = parts[parts.size() - 2];
    if (splitDateTime(epoch, date, time) && parseDateTime(date, time, chunk)) {
      outKey = ChunkKey(epoch, chunk);
      return SUCCESS;
    }
  }
  return FILEPATH_PARSE_ERROR;
}

int buildChunkIndex(const vector<string>& roots, const ChunkFileSpec& spec, ChunkIndex& outIndex) {
  outIndex.clear();
  for (const string& root : roots) {
    if (!os::isDir(root)) {
      XR_LOGD("Skipping data root '{}': not a folder", root);
      continue;
    }
    vector<string> files;
    auto filter = [&spec](const vector<string>& relativeParts) {
      return matchesFileSpec(relativeParts, spec);
    };
    IF_ERROR_LOG_FILE_AND_RETURN(os::findFiles(root, filter, files), root);
    for (const string& file : files) {
      ChunkKey key;
      if (getChunkKey(file, key) != SUCCESS) {
        XR_LOGW("Can't get the chunk key of '{}', skipping it", file);
        continue;
      }
      outIndex[key] = file;
    }
  }
  XR_LOGD("Found {} chunk files for {}.{}", outIndex.size(), spec.pattern, spec.extension);
  return SUCCESS;
}

} // namespace chunkio
