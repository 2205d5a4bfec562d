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

#include "Value.h"

#include <fmt/format.h>

using namespace std;

namespace chunkio {

Value::Value(bool value) : type_{Type::Bool}, int_{value ? 1 : 0} {}
Value::Value(int value) : type_{Type::Int}, int_{value} {}
Value::Value(int64_t value) : type_{Type::Int}, int_{value} {}
Value::Value(uint64_t value) : type_{Type::Int}, int_{static_cast<int64_t>(value)} {}
Value::Value(double value) : type_{Type::Double}, double_{value} {}
Value::Value(const char* value) : type_{Type::String}, string_{value} {}
Value::Value(string value) : type_{Type::String}, string_{std::move(value)} {}
Value::Value(List list) : type_{Type::List}, list_{make_shared<const List>(std::move(list))} {}
Value::Value(Map map) : type_{Type::Map}, map_{make_shared<const Map>(std::move(map))} {}

bool Value::getBool() const {
  switch (type_) {
    case Type::Bool:
    case Type::Int:
      return int_ != 0;
    case Type::Double:
      return double_ != 0;
    default:
      return false;
  }
}

int64_t Value::getInt() const {
  switch (type_) {
    case Type::Bool:
    case Type::Int:
      return int_;
    case Type::Double:
      return static_cast<int64_t>(double_);
    default:
      return 0;
  }
}

double Value::getDouble() const {
  switch (type_) {
    case Type::Bool:
    case Type::Int:
      return static_cast<double>(int_);
    case Type::Double:
      return double_;
    default:
      return 0;
  }
}

const string& Value::getString() const {
  static const string sEmpty;
  return type_ == Type::String ? string_ : sEmpty;
}

const Value::List& Value::getList() const {
  static const List sEmpty;
  return list_ ? *list_ : sEmpty;
}

const Value::Map& Value::getMap() const {
  static const Map sEmpty;
  return map_ ? *map_ : sEmpty;
}

string Value::toString() const {
  switch (type_) {
    case Type::Missing:
      return "<NA>";
    case Type::Bool:
      return int_ != 0 ? "true" : "false";
    case Type::Int:
      return to_string(int_);
    case Type::Double:
      return fmt::format("{}", double_);
    case Type::String:
      return string_;
    case Type::List: {
      string text = "[";
      for (const Value& value : *list_) {
        if (text.size() > 1) {
          text += ", ";
        }
        text += value.toString();
      }
      return text + "]";
    }
    case Type::Map: {
      string text = "{";
      for (const auto& entry : *map_) {
        if (text.size() > 1) {
          text += ", ";
        }
        text += entry.first + ": " + entry.second.toString();
      }
      return text + "}";
    }
  }
  return {};
}

bool Value::operator==(const Value& rhs) const {
  if (isNumber() && rhs.isNumber()) {
    if ((type_ == Type::Double) || (rhs.type_ == Type::Double)) {
      return getDouble() == rhs.getDouble();
    }
    return int_ == rhs.int_;
  }
  if (type_ != rhs.type_) {
    return false;
  }
  switch (type_) {
    case Type::Missing:
      return true;
    case Type::String:
      return string_ == rhs.string_;
    case Type::List:
      return getList() == rhs.getList();
    case Type::Map:
      return getMap() == rhs.getMap();
    default:
      return false;
  }
}

} // namespace chunkio
