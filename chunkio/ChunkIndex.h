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

#pragma once

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <chunkio/Time.h>

namespace chunkio {

/// Identifies the file of one acquisition chunk: its epoch, and the time of the chunk.
struct ChunkKey {
  ChunkKey() = default;
  ChunkKey(std::string epoch, const Time& chunk) : epoch{std::move(epoch)}, chunk{chunk} {}

  std::string epoch;
  Time chunk;

  bool operator<(const ChunkKey& rhs) const {
    return std::tie(epoch, chunk) < std::tie(rhs.epoch, rhs.chunk);
  }
  bool operator==(const ChunkKey& rhs) const {
    return epoch == rhs.epoch && chunk == rhs.chunk;
  }
};

/// Chunk files of a data stream, sorted by key.
using ChunkIndex = std::map<ChunkKey, std::string>;

/// Get the chunk key of a data file.
/// Chunked files are named "<stream>_YYYY-MM-DDTHH-MM-SS.<ext>", and sit two folders below their
/// epoch folder: the epoch is the folder three levels up.
/// Files that aren't chunked, such as epoch metadata documents, take their time and their epoch
/// from their parent folder, which is named "YYYY-MM-DDTHH-MM-SS".
/// @return A status code, 0 meaning success. FILEPATH_PARSE_ERROR if neither convention applies.
int getChunkKey(const std::string& path, ChunkKey& outKey);

/// Search parameters of chunk files.
struct ChunkFileSpec {
  /// Wildcard pattern of the file names, without extension. May start with folder names.
  std::string pattern;
  std::string extension;
  /// Wildcard pattern of the epoch folder names. Empty means any epoch.
  std::string epochPattern;
};

/// Find the chunk files of a data stream under one or more roots.
/// Files are searched as "<root>/<epoch>/**/<pattern>.<extension>".
/// @param roots: data roots, by increasing priority. When several roots have a file for the same
/// chunk key, the file of the last root wins. Roots that don't exist are ignored.
/// @param spec: the files to search.
/// @param outIndex: on exit, the chunk files found. Files whose key can't be parsed are skipped.
/// @return A status code, 0 meaning success.
int buildChunkIndex(
    const std::vector<std::string>& roots,
    const ChunkFileSpec& spec,
    ChunkIndex& outIndex);

} // namespace chunkio
