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

#include "Strings.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

using namespace std;

namespace chunkio {
namespace helpers {

string trim(const string& text, const char* whiteChars) {
  size_t end = text.length();
  while (end > 0 && strchr(whiteChars, text[end - 1]) != nullptr) {
    end--;
  }
  if (end == 0) {
    return {};
  }
  size_t start = 0;
  while (start < end && strchr(whiteChars, text[start]) != nullptr) {
    start++;
  }
  if (start > 0 || end < text.length()) {
    return text.substr(start, end - start);
  }
  return text;
}

inline bool isdigit(char c) {
  return std::isdigit(static_cast<uint8_t>(c));
}

static uint32_t lastDigitIndex(const char* str, uint32_t index) {
  while (isdigit(str[index + 1])) {
    index++;
  }
  return index;
}

inline char paddedChar(const char* str, uint32_t pos, uint32_t pad, uint32_t index) {
  return index < pad ? '0' : str[pos + index - pad];
}

bool beforeFileName(const char* left, const char* right) {
  uint32_t leftPos = 0;
  uint32_t rightPos = 0;
  bool bothDigits = false;
  while ((bothDigits = (isdigit(left[leftPos]) && isdigit(right[rightPos]))) ||
         (left[leftPos] == right[rightPos] && left[leftPos] != 0)) {
    if (bothDigits) {
      uint32_t leftDigitLength = lastDigitIndex(left, leftPos) - leftPos;
      uint32_t rightDigitLength = lastDigitIndex(right, rightPos) - rightPos;
      uint32_t leftPad =
          leftDigitLength < rightDigitLength ? rightDigitLength - leftDigitLength : 0;
      uint32_t rightPad =
          rightDigitLength < leftDigitLength ? leftDigitLength - rightDigitLength : 0;
      uint32_t lastIndex = max<uint32_t>(leftDigitLength, rightDigitLength);
      for (uint32_t digitIndex = 0; digitIndex <= lastIndex; digitIndex++) {
        char lc = paddedChar(left, leftPos, leftPad, digitIndex);
        char rc = paddedChar(right, rightPos, rightPad, digitIndex);
        if (lc != rc) {
          return lc < rc;
        }
      }
      leftPos += leftDigitLength;
      rightPos += rightDigitLength;
    }
    leftPos++, rightPos++;
  }
  if (left[leftPos] == 0) {
    return right[rightPos] != 0;
  }
  return left[leftPos] < right[rightPos];
}

bool replaceAll(string& inOutString, const string& token, const string& replacement) {
  bool replaced = false;
  if (!token.empty()) {
    size_t pos = inOutString.find(token, 0);
    while (pos != string::npos) {
      inOutString.replace(pos, token.length(), replacement);
      replaced = true;
      pos = inOutString.find(token, pos + replacement.length());
    }
  }
  return replaced;
}

// Match a "[...]" class starting at pattern[p] (just after '['). Sets 'end' past the ']'.
// Returns false in 'valid' if the class isn't closed, in which case '[' is a literal.
static bool matchClass(const string_view& pattern, size_t p, char c, size_t& end, bool& valid) {
  bool negate = false;
  if (p < pattern.size() && (pattern[p] == '!' || pattern[p] == '^')) {
    negate = true;
    p++;
  }
  bool matched = false;
  bool first = true;
  while (p < pattern.size() && (first || pattern[p] != ']')) {
    first = false;
    char low = pattern[p];
    char high = low;
    if (p + 2 < pattern.size() && pattern[p + 1] == '-' && pattern[p + 2] != ']') {
      high = pattern[p + 2];
      p += 2;
    }
    if (low <= c && c <= high) {
      matched = true;
    }
    p++;
  }
  valid = p < pattern.size();
  end = p + 1;
  return matched != negate;
}

bool matchWildcard(const string_view& pattern, const string_view& text) {
  size_t p = 0;
  size_t t = 0;
  size_t starP = string_view::npos;
  size_t starT = 0;
  while (t < text.size()) {
    if (p < pattern.size()) {
      char pc = pattern[p];
      if (pc == '*') {
        starP = p++;
        starT = t;
        continue;
      }
      if (pc == '?') {
        p++;
        t++;
        continue;
      }
      if (pc == '[') {
        size_t end = 0;
        bool valid = false;
        bool matched = matchClass(pattern, p + 1, text[t], end, valid);
        if (valid) {
          if (matched) {
            p = end;
            t++;
            continue;
          }
        } else if (text[t] == '[') {
          p++;
          t++;
          continue;
        }
      } else if (pc == text[t]) {
        p++;
        t++;
        continue;
      }
    }
    if (starP == string_view::npos) {
      return false;
    }
    p = starP + 1;
    t = ++starT;
  }
  while (p < pattern.size() && pattern[p] == '*') {
    p++;
  }
  return p == pattern.size();
}

string toPascalCase(const string& name) {
  string result;
  result.reserve(name.size());
  bool upper = true;
  for (char c : name) {
    if (c == '_') {
      upper = true;
    } else {
      result.push_back(upper ? static_cast<char>(toupper(static_cast<uint8_t>(c))) : c);
      upper = false;
    }
  }
  return result;
}

bool readInt64(const string& str, int64_t& outValue) {
  if (str.empty() || isspace(static_cast<uint8_t>(str.front()))) {
    return false;
  }
  char* next = nullptr;
  errno = 0;
  long long value = strtoll(str.c_str(), &next, 10);
  if (*next != 0 || errno == ERANGE) {
    return false;
  }
  outValue = value;
  return true;
}

bool readDouble(const string& str, double& outValue) {
  if (str.empty() || isspace(static_cast<uint8_t>(str.front()))) {
    return false;
  }
  char* next = nullptr;
  double value = strtod(str.c_str(), &next);
  if (*next != 0) {
    return false;
  }
  outValue = value;
  return true;
}

size_t split(
    const std::string& inputString,
    char delimiter,
    std::vector<std::string>& tokens,
    bool skipEmpty,
    const char* trimChars) {
  tokens.clear();
  std::stringstream ss(inputString);
  std::string item;

  while (getline(ss, item, delimiter)) {
    if (trimChars != nullptr) {
      item = helpers::trim(item, trimChars);
    }
    if (!(item.empty() && skipEmpty)) {
      tokens.push_back(item);
    }
  }
  return tokens.size();
}

} // namespace helpers
} // namespace chunkio
