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

#include <boost/date_time/posix_time/posix_time.hpp>

namespace chunkio {

/// Instants and durations of the whole API. A default constructed Time or Duration is
/// "not_a_date_time", which stands for an absent value.
using Time = boost::posix_time::ptime;
using Duration = boost::posix_time::time_duration;

/// Default duration of an acquisition chunk, in whole hours.
constexpr int kDefaultChunkDurationHours = 1;

/// Reference epoch of recorder timestamps: 1904-01-01T00:00:00.
const Time& getReferenceEpoch();

/// Convert recorder seconds since the reference epoch to an instant, with microsecond resolution.
Time toTime(double seconds);
std::vector<Time> toTime(const std::vector<double>& seconds);

/// Convert an instant to recorder seconds since the reference epoch.
double toSeconds(const Time& time);
std::vector<double> toSeconds(const std::vector<Time>& times);

/// Get the acquisition chunk of an instant: the start of the whole chunk containing it,
/// with chunks aligned on midnight.
Time getChunk(const Time& time, int chunkDurationHours = kDefaultChunkDurationHours);
std::vector<Time> getChunk(
    const std::vector<Time>& times,
    int chunkDurationHours = kDefaultChunkDurationHours);

/// Every chunk from the chunk of start to the chunk of end, both included.
std::vector<Time> getChunkRange(
    const Time& start,
    const Time& end,
    int chunkDurationHours = kDefaultChunkDurationHours);

/// Parse a "YYYY-MM-DD" date and a "HH-MM-SS", "HH_MM_SS" or "HH:MM:SS" time, with optional
/// fractional seconds, into an instant.
/// @return True on success. outTime is not modified on failure.
bool parseDateTime(const std::string& date, const std::string& time, Time& outTime);

/// Parse a "YYYY-MM-DDTHH-MM-SS" string, as used in epoch and chunk names.
bool parseDateTime(const std::string& dateTime, Time& outTime);

/// Format an instant as used in chunk file names: "YYYY-MM-DDTHH-MM-SS".
std::string formatChunkTime(const Time& time);

} // namespace chunkio
