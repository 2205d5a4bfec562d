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
#include <string>
#include <string_view>
#include <vector>

namespace chunkio {
namespace helpers {

/// Compare strings, as you'd expect in a modern desktop OS (Explorer/Finder), treating digit
/// sections as numbers, so that "image1.png" is before "image02.png" and "image10.png".
bool beforeFileName(const char* left, const char* right);

inline bool beforefileName(const std::string& left, const std::string& right) {
  return beforeFileName(left.c_str(), right.c_str());
}

/// Trim a string by removing specific characters from the beginning and the end of the string.
/// @param text: the text to trim.
/// @param whiteChars: characters to remove.
/// @return The trimmed string.
std::string trim(const std::string& text, const char* whiteChars = " \t");

/// Replace all the occurrences of a token in a string.
/// @return True if any replacement was made.
bool replaceAll(std::string& inOutString, const std::string& token, const std::string& replacement);

/// Shell-style wildcard match of a whole text: '*' matches any sequence, '?' any single character,
/// and "[abc]", "[a-z]" or "[!abc]" a character class. Case sensitive.
bool matchWildcard(const std::string_view& pattern, const std::string_view& text);

/// Convert a snake_case identifier to PascalCase: "dummy_device" -> "DummyDevice".
std::string toPascalCase(const std::string& name);

/// Strict number parsing: the whole string must be consumed.
bool readInt64(const std::string& str, int64_t& outValue);
bool readDouble(const std::string& str, double& outValue);

/// Split a string into tokens, with a delimiter.
/// @param inputString: the string to split.
/// @param delimiter: the delimiter.
/// @param outTokens: the collection of strings generated by the split.
/// @param skipEmpty: if true, won't return empty tokens
/// @param trimChars: if specified, characters to trim for each token
/// @return The number of tokens extracted.
size_t split(
    const std::string& inputString,
    char delimiter,
    std::vector<std::string>& outTokens,
    bool skipEmpty = false,
    const char* trimChars = nullptr);

} // namespace helpers
} // namespace chunkio
