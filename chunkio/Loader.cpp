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

#include "Loader.h"

#include <algorithm>
#include <map>

#define DEFAULT_LOG_CHANNEL "Loader"
#include <logging/Log.h>

#include <chunkio/ErrorCode.h>
#include <chunkio/helpers/FileMacros.h>

using namespace std;

namespace pt = boost::posix_time;

namespace chunkio {

namespace {

bool isSet(const Time& time) {
  return !time.is_not_a_date_time();
}

// Find the single row at a time, in a table not in chronological order.
bool findUniqueRow(const vector<Row>& rows, const Time& time, size_t& outIndex) {
  size_t count = 0;
  for (size_t k = 0; k < rows.size(); ++k) {
    if (rows[k].time == time) {
      outIndex = k;
      ++count;
    }
  }
  return count == 1;
}

int readChunk(const Reader& reader, const string& path, Table& outTable) {
  IF_ERROR_LOG_FILE_AND_RETURN(reader.read(path, outTable), path);
  return SUCCESS;
}

// For each time, use the last row at or before it, within tolerance.
// @return The number of times without a matching row.
size_t reindexPad(
    const Table& source,
    const vector<Time>& times,
    const Duration& tolerance,
    Table& outTable) {
  vector<const Row*> rows;
  rows.reserve(source.size());
  if (source.hasTimeIndex()) {
    for (const Row& row : source.getRows()) {
      if (!row.time.is_special()) {
        rows.push_back(&row);
      }
    }
  }
  stable_sort(rows.begin(), rows.end(), [](const Row* lhs, const Row* rhs) {
    return lhs->time < rhs->time;
  });
  outTable = Table(source.getColumns());
  outTable.reserve(times.size());
  size_t missing = 0;
  for (const Time& time : times) {
    auto next = upper_bound(rows.begin(), rows.end(), time, [](const Time& t, const Row* row) {
      return t < row->time;
    });
    const Row* match = next != rows.begin() ? *(next - 1) : nullptr;
    if (match != nullptr && !tolerance.is_special() && time - match->time > tolerance) {
      match = nullptr;
    }
    if (match != nullptr) {
      outTable.getRows().emplace_back(time, match->values);
    } else {
      outTable.addRow(time, {});
      ++missing;
    }
  }
  return missing;
}

} // namespace

const char* toString(Inclusive inclusive) {
  switch (inclusive) {
    case Inclusive::Both:
      return "both";
    case Inclusive::Left:
      return "left";
    case Inclusive::Right:
      return "right";
    case Inclusive::Neither:
      return "neither";
  }
  return "unknown";
}

int filterTimeRange(
    const Table& table,
    const Time& start,
    const Time& end,
    Inclusive inclusive,
    Table& outTable) {
  const vector<Row>& rows = table.getRows();
  size_t first = 0;
  size_t last = rows.size();
  if (table.isMonotonicIncreasing()) {
    auto before = [](const Row& row, const Time& time) { return row.time < time; };
    auto after = [](const Time& time, const Row& row) { return time < row.time; };
    if (isSet(start)) {
      first =
          static_cast<size_t>(lower_bound(rows.begin(), rows.end(), start, before) - rows.begin());
    }
    if (isSet(end)) {
      last = static_cast<size_t>(upper_bound(rows.begin(), rows.end(), end, after) - rows.begin());
    }
  } else {
    size_t index = 0;
    if (isSet(start)) {
      if (!findUniqueRow(rows, start, index)) {
        XR_LOGD("Start time {} not found in data index", pt::to_iso_extended_string(start));
        return INDEX_LOOKUP_ERROR;
      }
      first = index;
    }
    if (isSet(end)) {
      if (!findUniqueRow(rows, end, index)) {
        XR_LOGD("End time {} not found in data index", pt::to_iso_extended_string(end));
        return INDEX_LOOKUP_ERROR;
      }
      last = index + 1;
    }
  }
  Table result = table.slice(first, last);
  if (inclusive == Inclusive::Both || result.empty()) {
    outTable = std::move(result);
    return SUCCESS;
  }
  const bool firstIsStart = isSet(start) && result.getRows().front().time == start;
  const bool lastIsEnd = isSet(end) && result.getRows().back().time == end;
  size_t begin = 0;
  size_t count = result.size();
  if ((inclusive == Inclusive::Right || inclusive == Inclusive::Neither) && firstIsStart) {
    begin = 1;
  }
  if ((inclusive == Inclusive::Left || inclusive == Inclusive::Neither) && lastIsEnd) {
    count--;
  }
  outTable = result.slice(begin, count);
  return SUCCESS;
}

int load(
    const vector<string>& roots,
    const Reader& reader,
    const LoadOptions& options,
    Table& outTable) {
  ChunkIndex index;
  IF_ERROR_RETURN(buildChunkIndex(
      roots, {reader.getPattern(), reader.getExtension(), options.epoch}, index));
  const bool hasBounds = isSet(options.start) || isSet(options.end);
  if (hasBounds) {
    // chunk level pre-filter: chunks partially in range are read in full
    const int hours = options.chunkDurationHours;
    const Time chunkStart =
        isSet(options.start) ? getChunk(options.start, hours) : Time(pt::neg_infin);
    const Time chunkEnd = isSet(options.end) ? getChunk(options.end, hours) : Time(pt::pos_infin);
    for (auto iter = index.begin(); iter != index.end();) {
      Time chunk = getChunk(iter->first.chunk, hours);
      if (chunk < chunkStart || chunk > chunkEnd) {
        iter = index.erase(iter);
      } else {
        ++iter;
      }
    }
  }
  if (index.empty()) {
    outTable = Table(reader.getColumns());
    return SUCCESS;
  }
  Table data;
  bool firstChunk = true;
  for (const auto& entry : index) {
    Table chunkData;
    IF_ERROR_RETURN(readChunk(reader, entry.second, chunkData));
    if (firstChunk) {
      data = std::move(chunkData);
      firstChunk = false;
    } else {
      data.append(chunkData);
    }
  }
  if (!hasBounds) {
    outTable = std::move(data);
    return SUCCESS;
  }
  int status = filterTimeRange(data, options.start, options.end, options.inclusive, outTable);
  if (status == INDEX_LOOKUP_ERROR && !data.isMonotonicIncreasing()) {
    XR_LOGW("Data index for {} contains out-of-order timestamps!", reader.getPattern());
    data.sortByTime();
    outTable = std::move(data);
    return SUCCESS;
  }
  if (status != 0) {
    XR_LOGE(
        "Failed to filter {} between {} and {}: {}",
        reader.getPattern(),
        pt::to_iso_extended_string(options.start),
        pt::to_iso_extended_string(options.end),
        errorCodeToMessage(status));
  }
  return status;
}

int load(
    const vector<string>& roots,
    const Reader& reader,
    const vector<Time>& times,
    const LoadOptions& options,
    Table& outTable) {
  if (times.empty()) {
    outTable = Table(reader.getColumns());
    return SUCCESS;
  }
  ChunkIndex index;
  IF_ERROR_RETURN(buildChunkIndex(
      roots, {reader.getPattern(), reader.getExtension(), options.epoch}, index));
  vector<Time> fileTimes;
  vector<const string*> files;
  fileTimes.reserve(index.size());
  files.reserve(index.size());
  for (const auto& entry : index) {
    fileTimes.push_back(entry.first.chunk);
    files.push_back(&entry.second);
  }
  map<Time, vector<Time>> groups;
  for (const Time& time : times) {
    groups[getChunk(time, options.chunkDurationHours)].push_back(time);
  }
  Table result;
  bool firstGroup = true;
  for (const auto& group : groups) {
    size_t i = static_cast<size_t>(
        lower_bound(fileTimes.begin(), fileTimes.end(), group.first) - fileTimes.begin());
    const bool hasChunk = i < files.size();
    Table frame;
    if (hasChunk) {
      IF_ERROR_RETURN(readChunk(reader, *files[i], frame));
    } else {
      frame = Table(reader.getColumns());
    }
    Table data;
    size_t missing = reindexPad(frame, group.second, options.tolerance, data);
    if (missing > 0 && hasChunk && i > 0) {
      // samples of the previous chunk may still be the latest
      Table previous;
      IF_ERROR_RETURN(readChunk(reader, *files[i - 1], previous));
      previous.append(frame);
      reindexPad(previous, group.second, options.tolerance, data);
    }
    if (firstGroup) {
      result = std::move(data);
      firstGroup = false;
    } else {
      result.append(data);
    }
  }
  outTable = std::move(result);
  return SUCCESS;
}

} // namespace chunkio
