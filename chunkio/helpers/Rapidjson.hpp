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

#include <cstring>

#include <string>
#include <vector>

#define RAPIDJSON_NAMESPACE chunkio_rapidjson
#define RAPIDJSON_HAS_STDSTRING 1
#define RAPIDJSON_PARSE_DEFAULT_FLAGS kParseFullPrecisionFlag | kParseNanAndInfFlag

#include <rapidjson/document.h>

#include <chunkio/Value.h>

namespace chunkio {

using std::string;

/// rapidjson::Document's default MemoryPoolAllocator crashes on some platforms
/// as documented in https://github.com/cocos2d/cocos2d-x/issues/16492
using JUtf8Encoding = chunkio_rapidjson::UTF8<>;
using JCrtAllocator = chunkio_rapidjson::CrtAllocator;
using JDocument = chunkio_rapidjson::GenericDocument<JUtf8Encoding, JCrtAllocator>;
using JValue = chunkio_rapidjson::GenericValue<JUtf8Encoding, JCrtAllocator>;
using JStringRef = chunkio_rapidjson::GenericStringRef<char>;

static inline JStringRef jStringRef(const char* str) {
  return JStringRef(str, strlen(str));
}
static inline JStringRef jStringRef(const string& str) {
  return JStringRef(str.c_str(), str.size());
}
template <class T>
static inline void jParse(JDocument& document, const T& str) {
  document.Parse(str.data(), str.size());
}

template <typename JSTR>
inline bool getJString(string& outString, const JValue& piece, const JSTR& name) {
  const auto& member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsString()) {
    outString = member->value.GetString();
    return true;
  }
  return false;
}

/// Truthiness of a json value: null, false, zero, and empty strings, arrays and objects are false.
inline bool isJTruthy(const JValue& value) {
  switch (value.GetType()) {
    case chunkio_rapidjson::kNullType:
    case chunkio_rapidjson::kFalseType:
      return false;
    case chunkio_rapidjson::kTrueType:
      return true;
    case chunkio_rapidjson::kNumberType:
      return value.GetDouble() != 0;
    case chunkio_rapidjson::kStringType:
      return value.GetStringLength() > 0;
    case chunkio_rapidjson::kArrayType:
      return !value.Empty();
    case chunkio_rapidjson::kObjectType:
      return value.MemberCount() > 0;
  }
  return false;
}

/// Depth first search of the first truthy member with a given name, in a tree of objects and
/// arrays. An object's own members are checked before its children.
/// @return A pointer to the value found, or nullptr.
inline const JValue* findNestedJMember(const JValue& piece, const char* name) {
  if (piece.IsObject()) {
    const auto& member = piece.FindMember(name);
    if (member != piece.MemberEnd() && isJTruthy(member->value)) {
      return &member->value;
    }
    for (const auto& child : piece.GetObject()) {
      const JValue* found = findNestedJMember(child.value, name);
      if (found != nullptr) {
        return found;
      }
    }
  } else if (piece.IsArray()) {
    for (const auto& child : piece.GetArray()) {
      const JValue* found = findNestedJMember(child, name);
      if (found != nullptr) {
        return found;
      }
    }
  }
  return nullptr;
}

/// Read an array of strings.
/// @return False if the value isn't an array of strings.
inline bool getJStringVector(const JValue& value, std::vector<string>& outStrings) {
  outStrings.clear();
  if (!value.IsArray()) {
    return false;
  }
  for (const auto& item : value.GetArray()) {
    if (!item.IsString()) {
      return false;
    }
    outStrings.emplace_back(item.GetString(), item.GetStringLength());
  }
  return true;
}

/// Convert a json value to a table cell value, recursively.
inline Value jValueToValue(const JValue& value) {
  switch (value.GetType()) {
    case chunkio_rapidjson::kNullType:
      return {};
    case chunkio_rapidjson::kFalseType:
      return Value(false);
    case chunkio_rapidjson::kTrueType:
      return Value(true);
    case chunkio_rapidjson::kNumberType:
      if (value.IsInt64()) {
        return Value(value.GetInt64());
      }
      if (value.IsUint64()) {
        return Value(value.GetUint64());
      }
      return Value(value.GetDouble());
    case chunkio_rapidjson::kStringType:
      return Value(string(value.GetString(), value.GetStringLength()));
    case chunkio_rapidjson::kArrayType: {
      Value::List list;
      list.reserve(value.Size());
      for (const auto& item : value.GetArray()) {
        list.emplace_back(jValueToValue(item));
      }
      return Value(std::move(list));
    }
    case chunkio_rapidjson::kObjectType: {
      Value::Map map;
      for (const auto& member : value.GetObject()) {
        map[string(member.name.GetString(), member.name.GetStringLength())] =
            jValueToValue(member.value);
      }
      return Value(std::move(map));
    }
  }
  return {};
}

} // namespace chunkio
