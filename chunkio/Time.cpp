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

#include "Time.h"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "Time"
#include <logging/Log.h>

#include <chunkio/helpers/Strings.h>

using namespace std;

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

namespace chunkio {

namespace {

constexpr double kMicrosecondsPerSecond = 1e6;

bool readField(const string& text, int minValue, int maxValue, int& outValue) {
  if (text.empty() || text.size() > 4) {
    return false;
  }
  if (text.find_first_not_of("0123456789") != string::npos) {
    return false;
  }
  outValue = stoi(text);
  return outValue >= minValue && outValue <= maxValue;
}

} // namespace

const Time& getReferenceEpoch() {
  static const Time sEpoch(gr::date(1904, gr::Jan, 1));
  return sEpoch;
}

Time toTime(double seconds) {
  return getReferenceEpoch() +
      pt::microseconds(static_cast<int64_t>(llround(seconds * kMicrosecondsPerSecond)));
}

vector<Time> toTime(const vector<double>& seconds) {
  vector<Time> times;
  times.reserve(seconds.size());
  for (double s : seconds) {
    times.emplace_back(toTime(s));
  }
  return times;
}

double toSeconds(const Time& time) {
  Duration elapsed = time - getReferenceEpoch();
  return static_cast<double>(elapsed.total_microseconds()) / kMicrosecondsPerSecond;
}

vector<double> toSeconds(const vector<Time>& times) {
  vector<double> seconds;
  seconds.reserve(times.size());
  for (const Time& time : times) {
    seconds.push_back(toSeconds(time));
  }
  return seconds;
}

Time getChunk(const Time& time, int chunkDurationHours) {
  if (time.is_special() || chunkDurationHours <= 0) {
    return time;
  }
  int hour = static_cast<int>(time.time_of_day().hours());
  return Time(time.date(), pt::hours(chunkDurationHours * (hour / chunkDurationHours)));
}

vector<Time> getChunk(const vector<Time>& times, int chunkDurationHours) {
  vector<Time> chunks;
  chunks.reserve(times.size());
  for (const Time& time : times) {
    chunks.emplace_back(getChunk(time, chunkDurationHours));
  }
  return chunks;
}

vector<Time> getChunkRange(const Time& start, const Time& end, int chunkDurationHours) {
  vector<Time> chunks;
  if (start.is_special() || end.is_special() || chunkDurationHours <= 0) {
    return chunks;
  }
  Time last = getChunk(end, chunkDurationHours);
  for (Time chunk = getChunk(start, chunkDurationHours); chunk <= last;
       chunk += pt::hours(chunkDurationHours)) {
    chunks.push_back(chunk);
  }
  return chunks;
}

bool parseDateTime(const string& date, const string& time, Time& outTime) {
  vector<string> dateParts;
  if (helpers::split(date, '-', dateParts) != 3) {
    return false;
  }
  int year = 0, month = 0, day = 0;
  if (dateParts[0].size() != 4 || !readField(dateParts[0], 1400, 9999, year) ||
      !readField(dateParts[1], 1, 12, month) || !readField(dateParts[2], 1, 31, day)) {
    return false;
  }
  string clock = time;
  int64_t microseconds = 0;
  size_t dot = clock.find('.');
  if (dot != string::npos) {
    string fraction = clock.substr(dot + 1);
    clock.resize(dot);
    if (fraction.empty() || fraction.size() > 6 ||
        fraction.find_first_not_of("0123456789") != string::npos) {
      return false;
    }
    fraction.append(6 - fraction.size(), '0');
    microseconds = stoll(fraction);
  }
  helpers::replaceAll(clock, "_", ":");
  helpers::replaceAll(clock, "-", ":");
  vector<string> clockParts;
  if (helpers::split(clock, ':', clockParts) != 3) {
    return false;
  }
  int hours = 0, minutes = 0, seconds = 0;
  if (!readField(clockParts[0], 0, 23, hours) || !readField(clockParts[1], 0, 59, minutes) ||
      !readField(clockParts[2], 0, 59, seconds)) {
    return false;
  }
  try {
    gr::date calendarDay(
        static_cast<unsigned short>(year),
        static_cast<unsigned short>(month),
        static_cast<unsigned short>(day));
    outTime = Time(
        calendarDay,
        pt::hours(hours) + pt::minutes(minutes) + pt::seconds(seconds) +
            pt::microseconds(microseconds));
  } catch (const std::out_of_range& e) {
    XR_LOGD("Invalid date '{}': {}", date, e.what());
    return false;
  }
  return true;
}

bool parseDateTime(const string& dateTime, Time& outTime) {
  vector<string> parts;
  if (helpers::split(dateTime, 'T', parts) != 2) {
    return false;
  }
  return parseDateTime(parts[0], parts[1], outTime);
}

string formatChunkTime(const Time& time) {
  const gr::date day = time.date();
  const Duration clock = time.time_of_day();
  return fmt::format(
      "{:04}-{:02}-{:02}T{:02}-{:02}-{:02}",
      static_cast<int>(day.year()),
      static_cast<int>(day.month()),
      static_cast<int>(day.day()),
      clock.hours(),
      clock.minutes(),
      clock.seconds());
}

} // namespace chunkio
