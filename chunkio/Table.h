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

#include <cstddef>
#include <string>
#include <vector>

#include <chunkio/Time.h>
#include <chunkio/Value.h>

namespace chunkio {

/// One row of a Table: its time index and one value per column.
struct Row {
  Row() = default;
  Row(const Time& time, std::vector<Value> values) : time{time}, values(std::move(values)) {}

  Time time;
  std::vector<Value> values;
};

/// Time indexed table with a named, ordered column set.
/// Rows keep their insertion order, which isn't necessarily chronological.
class Table {
 public:
  Table() = default;
  explicit Table(std::vector<std::string> columns, bool hasTimeIndex = true);

  const std::vector<std::string>& getColumns() const {
    return columns_;
  }
  size_t getColumnCount() const {
    return columns_.size();
  }
  /// @return The position of a column, or -1 if there is no such column.
  int getColumnIndex(const std::string& name) const;
  bool hasColumn(const std::string& name) const {
    return getColumnIndex(name) >= 0;
  }

  /// Tables without time index have their rows' time set to not_a_date_time.
  bool hasTimeIndex() const {
    return hasTimeIndex_;
  }
  void setHasTimeIndex(bool hasTimeIndex) {
    hasTimeIndex_ = hasTimeIndex;
  }

  size_t size() const {
    return rows_.size();
  }
  bool empty() const {
    return rows_.empty();
  }
  void reserve(size_t rowCount) {
    rows_.reserve(rowCount);
  }
  void clearRows() {
    rows_.clear();
  }

  const std::vector<Row>& getRows() const {
    return rows_;
  }
  std::vector<Row>& getRows() {
    return rows_;
  }
  const Row& getRow(size_t index) const {
    return rows_[index];
  }
  Row& getRow(size_t index) {
    return rows_[index];
  }
  const Time& getTime(size_t index) const {
    return rows_[index].time;
  }
  std::vector<Time> getTimes() const;

  /// Value of a cell, or a missing value if the column doesn't exist.
  const Value& get(size_t row, const std::string& column) const;
  std::vector<Value> getColumn(const std::string& column) const;

  /// Add a row. Missing values are appended if there are fewer values than columns.
  /// @return False if the row has more values than there are columns (the row is not added).
  bool addRow(const Time& time, std::vector<Value> values);

  /// Add a column at the end, filled with a value. Does nothing if the column exists.
  void addColumn(const std::string& name, const Value& fill = {});
  /// Insert a column at a position, with one value per row.
  /// @return False if the column exists, or if the position or value count is invalid.
  bool insertColumn(size_t position, const std::string& name, std::vector<Value> values);
  /// Set all the cells of a column, adding the column if needed.
  /// @return False if the value count doesn't match the row count.
  bool setColumn(const std::string& name, std::vector<Value> values);
  /// @return False if there is no such column.
  bool removeColumn(const std::string& name);

  /// Append the rows of another table. Columns are aligned by name, and new columns are added
  /// at the end. Cells of columns a row didn't have are missing.
  void append(const Table& other);

  /// Copy of the rows [begin, end), with the same columns.
  Table slice(size_t begin, size_t end) const;

  /// Stable sort of the rows by time.
  void sortByTime();
  /// Tell if row times never decrease. An empty table is monotonic.
  bool isMonotonicIncreasing() const;

 private:
  std::vector<std::string> columns_;
  std::vector<Row> rows_;
  bool hasTimeIndex_{true};
};

} // namespace chunkio
