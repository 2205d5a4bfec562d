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

#include "Table.h"

#include <algorithm>

#define DEFAULT_LOG_CHANNEL "Table"
#include <logging/Log.h>
#include <logging/Verify.h>

using namespace std;

namespace chunkio {

Table::Table(vector<string> columns, bool hasTimeIndex)
    : columns_{std::move(columns)}, hasTimeIndex_{hasTimeIndex} {}

int Table::getColumnIndex(const string& name) const {
  auto iter = find(columns_.begin(), columns_.end(), name);
  return iter != columns_.end() ? static_cast<int>(iter - columns_.begin()) : -1;
}

vector<Time> Table::getTimes() const {
  vector<Time> times;
  times.reserve(rows_.size());
  for (const Row& row : rows_) {
    times.push_back(row.time);
  }
  return times;
}

const Value& Table::get(size_t row, const string& column) const {
  static const Value sMissing;
  int index = getColumnIndex(column);
  if (index < 0 || row >= rows_.size()) {
    return sMissing;
  }
  return rows_[row].values[static_cast<size_t>(index)];
}

vector<Value> Table::getColumn(const string& column) const {
  vector<Value> values;
  int index = getColumnIndex(column);
  if (index >= 0) {
    values.reserve(rows_.size());
    for (const Row& row : rows_) {
      values.push_back(row.values[static_cast<size_t>(index)]);
    }
  }
  return values;
}

bool Table::addRow(const Time& time, vector<Value> values) {
  if (!XR_VERIFY(
          values.size() <= columns_.size(),
          "{} values for {} columns",
          values.size(),
          columns_.size())) {
    return false;
  }
  values.resize(columns_.size());
  rows_.emplace_back(time, std::move(values));
  return true;
}

void Table::addColumn(const string& name, const Value& fill) {
  if (hasColumn(name)) {
    return;
  }
  columns_.push_back(name);
  for (Row& row : rows_) {
    row.values.push_back(fill);
  }
}

bool Table::insertColumn(size_t position, const string& name, vector<Value> values) {
  if (hasColumn(name) || position > columns_.size() || values.size() != rows_.size()) {
    return false;
  }
  columns_.insert(columns_.begin() + static_cast<ptrdiff_t>(position), name);
  for (size_t k = 0; k < rows_.size(); ++k) {
    vector<Value>& rowValues = rows_[k].values;
    rowValues.insert(rowValues.begin() + static_cast<ptrdiff_t>(position), std::move(values[k]));
  }
  return true;
}

bool Table::setColumn(const string& name, vector<Value> values) {
  if (values.size() != rows_.size()) {
    return false;
  }
  addColumn(name);
  size_t index = static_cast<size_t>(getColumnIndex(name));
  for (size_t k = 0; k < rows_.size(); ++k) {
    rows_[k].values[index] = std::move(values[k]);
  }
  return true;
}

bool Table::removeColumn(const string& name) {
  int index = getColumnIndex(name);
  if (index < 0) {
    return false;
  }
  columns_.erase(columns_.begin() + index);
  for (Row& row : rows_) {
    row.values.erase(row.values.begin() + index);
  }
  return true;
}

void Table::append(const Table& other) {
  vector<size_t> mapping;
  mapping.reserve(other.columns_.size());
  for (const string& column : other.columns_) {
    int index = getColumnIndex(column);
    if (index < 0) {
      addColumn(column);
      index = static_cast<int>(columns_.size() - 1);
    }
    mapping.push_back(static_cast<size_t>(index));
  }
  rows_.reserve(rows_.size() + other.rows_.size());
  for (const Row& row : other.rows_) {
    vector<Value> values(columns_.size());
    for (size_t k = 0; k < mapping.size(); ++k) {
      values[mapping[k]] = row.values[k];
    }
    rows_.emplace_back(row.time, std::move(values));
  }
  hasTimeIndex_ = hasTimeIndex_ || other.hasTimeIndex_;
}

Table Table::slice(size_t begin, size_t end) const {
  Table result(columns_, hasTimeIndex_);
  end = min(end, rows_.size());
  if (begin < end) {
    result.rows_.assign(
        rows_.begin() + static_cast<ptrdiff_t>(begin), rows_.begin() + static_cast<ptrdiff_t>(end));
  }
  return result;
}

void Table::sortByTime() {
  stable_sort(rows_.begin(), rows_.end(), [](const Row& lhs, const Row& rhs) {
    return lhs.time < rhs.time;
  });
}

bool Table::isMonotonicIncreasing() const {
  for (size_t k = 1; k < rows_.size(); ++k) {
    if (rows_[k].time < rows_[k - 1].time) {
      return false;
    }
  }
  return true;
}

} // namespace chunkio
