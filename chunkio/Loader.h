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

#include <string>
#include <vector>

#include <chunkio/ChunkIndex.h>
#include <chunkio/Reader.h>
#include <chunkio/Table.h>
#include <chunkio/Time.h>

namespace chunkio {

/// Which bounds of a time range are part of the range.
enum class Inclusive { Both, Left, Right, Neither };

const char* toString(Inclusive inclusive);

/// Options of load() calls.
struct LoadOptions {
  /// Time range bounds. not_a_date_time means no bound.
  Time start;
  Time end;
  Inclusive inclusive{Inclusive::Both};
  /// Point queries: max distance between a requested time and the sample used for it.
  /// not_a_date_time means no limit.
  Duration tolerance{boost::posix_time::not_a_date_time};
  /// Wildcard pattern of the epoch folders to search. Empty means all epochs.
  std::string epoch;
  int chunkDurationHours{kDefaultChunkDurationHours};
};

/// Keep the rows of a table between two times, as a label based slice.
/// When the table's rows are in chronological order, bounds don't need to match any row.
/// Otherwise, each bound must match exactly one row, and the rows between them are kept, in place.
/// Inclusive::Left drops the last row if it's at end, Inclusive::Right drops the first row if it's
/// at start, and Inclusive::Neither does both.
/// @param start: first time to keep, or not_a_date_time to start from the first row.
/// @param end: last time to keep, or not_a_date_time to go to the last row.
/// @return A status code, 0 meaning success. INDEX_LOOKUP_ERROR if a bound isn't found in a table
/// not in chronological order.
int filterTimeRange(
    const Table& table,
    const Time& start,
    const Time& end,
    Inclusive inclusive,
    Table& outTable);

/// Load the data of a stream over a time range.
/// Chunk files in the chunks of the bounds are read in full, then the data is cut to the range.
/// If a bound can't be found because the data isn't in chronological order, a warning is logged,
/// and all the data read is returned, sorted by time.
/// @param roots: data roots, by increasing priority.
/// @param reader: reader of the stream.
/// @param options: time range, epoch filter and chunk duration.
/// @param outTable: the data, in chronological order.
/// @return A status code, 0 meaning success.
int load(
    const std::vector<std::string>& roots,
    const Reader& reader,
    const LoadOptions& options,
    Table& outTable);

/// Load the data of a stream at specific times.
/// Each time gets the last sample at or before it, if there is one within tolerance, or missing
/// values otherwise. Samples from the chunk before are used when a time is before the first sample
/// of its chunk. Times after the last chunk get missing values.
/// @param times: requested times, in any order, possibly with duplicates.
/// @param outTable: one row per requested time, grouped by chunk.
/// @return A status code, 0 meaning success.
int load(
    const std::vector<std::string>& roots,
    const Reader& reader,
    const std::vector<Time>& times,
    const LoadOptions& options,
    Table& outTable);

inline int load(
    const std::string& root,
    const Reader& reader,
    const LoadOptions& options,
    Table& outTable) {
  return load(std::vector<std::string>{root}, reader, options, outTable);
}

} // namespace chunkio
