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

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chunkio {

/// Cell value of a Table: missing, a scalar, or a nested list or map of values.
/// Lists and maps are immutable once stored, and shared between copies.
class Value {
 public:
  enum class Type { Missing, Bool, Int, Double, String, List, Map };

  using List = std::vector<Value>;
  using Map = std::map<std::string, Value>;

  Value() = default;
  Value(bool value);
  Value(int value);
  Value(int64_t value);
  Value(uint64_t value);
  Value(double value);
  Value(const char* value);
  Value(std::string value);
  explicit Value(List list);
  explicit Value(Map map);

  Type getType() const {
    return type_;
  }
  bool isMissing() const {
    return type_ == Type::Missing;
  }
  bool isNumber() const {
    return type_ == Type::Int || type_ == Type::Double || type_ == Type::Bool;
  }
  bool isInt() const {
    return type_ == Type::Int;
  }
  bool isString() const {
    return type_ == Type::String;
  }
  bool isList() const {
    return type_ == Type::List;
  }
  bool isMap() const {
    return type_ == Type::Map;
  }

  /// Numeric accessors convert between bool, int and double. Non numbers return 0.
  bool getBool() const;
  int64_t getInt() const;
  double getDouble() const;
  /// Non strings return an empty string.
  const std::string& getString() const;
  /// Non lists and non maps return an empty container.
  const List& getList() const;
  const Map& getMap() const;

  /// Human readable representation, for logs and tests.
  std::string toString() const;

  /// Missing values compare equal to each other. Ints and doubles compare by numeric value.
  bool operator==(const Value& rhs) const;
  bool operator!=(const Value& rhs) const {
    return !operator==(rhs);
  }

 private:
  Type type_{Type::Missing};
  int64_t int_{0};
  double double_{0};
  std::string string_;
  std::shared_ptr<const List> list_;
  std::shared_ptr<const Map> map_;
};

} // namespace chunkio
