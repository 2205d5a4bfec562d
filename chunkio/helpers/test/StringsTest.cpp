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

#include <gtest/gtest.h>

#include <chunkio/helpers/Strings.h>

struct StringsHelpersTester : testing::Test {};

using namespace std;
using namespace chunkio;

TEST_F(StringsHelpersTester, trim) {
  EXPECT_STREQ(helpers::trim("").c_str(), "");
  EXPECT_STREQ(helpers::trim(" \t ").c_str(), "");
  EXPECT_STREQ(helpers::trim(" he l\tlo ").c_str(), "he l\tlo");
  EXPECT_STREQ(helpers::trim("hello\t").c_str(), "hello");
  EXPECT_STREQ(helpers::trim(" hello ", "").c_str(), " hello ");
  EXPECT_STREQ(helpers::trim("hello\r", " \t\n\r").c_str(), "hello");
}

TEST_F(StringsHelpersTester, replaceAllTest) {
  string str = "CameraTop_202_gameapi_v1";
  EXPECT_TRUE(helpers::replaceAll(str, "_", "/"));
  EXPECT_EQ(str, "CameraTop/202/gameapi/v1");
  EXPECT_FALSE(helpers::replaceAll(str, "_", "/"));

  str = "[[[]]]";
  EXPECT_TRUE(helpers::replaceAll(str, "[", "{"));
  EXPECT_TRUE(helpers::replaceAll(str, "]]]", "}"));
  EXPECT_EQ(str, "{{{}");
}

TEST_F(StringsHelpersTester, matchWildcardTest) {
  using helpers::matchWildcard;
  EXPECT_TRUE(matchWildcard("Patch1_8_*.bin", "Patch1_8_2024-01-01T00-00-00.bin"));
  EXPECT_FALSE(matchWildcard("Patch1_8_*.bin", "Patch1_90_2024-01-01T00-00-00.bin"));
  EXPECT_FALSE(matchWildcard("Patch1_8_*.bin", "Patch1_8_2024-01-01T00-00-00.csv"));
  EXPECT_TRUE(matchWildcard("*", ""));
  EXPECT_TRUE(matchWildcard("*", "anything"));
  EXPECT_TRUE(matchWildcard("a*b*c", "aXbYbZc"));
  EXPECT_FALSE(matchWildcard("a*b*c", "aXbYbZ"));
  EXPECT_TRUE(matchWildcard("Camera?", "CameraA"));
  EXPECT_FALSE(matchWildcard("Camera?", "Camera"));
  EXPECT_TRUE(matchWildcard("2024-0[1-3]-*", "2024-02-15T10-00-00"));
  EXPECT_FALSE(matchWildcard("2024-0[1-3]-*", "2024-04-15T10-00-00"));
  EXPECT_TRUE(matchWildcard("Feeder[!2]", "Feeder1"));
  EXPECT_FALSE(matchWildcard("Feeder[!2]", "Feeder2"));
  EXPECT_FALSE(matchWildcard("metadata", "Metadata"));
  EXPECT_TRUE(matchWildcard("", ""));
  EXPECT_FALSE(matchWildcard("", "a"));
}

TEST_F(StringsHelpersTester, toPascalCaseTest) {
  EXPECT_EQ(helpers::toPascalCase("dummy_device"), "DummyDevice");
  EXPECT_EQ(helpers::toPascalCase("nested_data"), "NestedData");
  EXPECT_EQ(helpers::toPascalCase("camera"), "Camera");
  EXPECT_EQ(helpers::toPascalCase("light_cycle_"), "LightCycle");
  EXPECT_EQ(helpers::toPascalCase(""), "");
}

TEST_F(StringsHelpersTester, readNumbersTest) {
  int64_t i = 0;
  EXPECT_TRUE(helpers::readInt64("42", i));
  EXPECT_EQ(i, 42);
  EXPECT_TRUE(helpers::readInt64("-7", i));
  EXPECT_EQ(i, -7);
  EXPECT_FALSE(helpers::readInt64("4.2", i));
  EXPECT_FALSE(helpers::readInt64(" 42", i));
  EXPECT_FALSE(helpers::readInt64("", i));
  EXPECT_EQ(i, -7);

  double d = 0;
  EXPECT_TRUE(helpers::readDouble("3.5", d));
  EXPECT_DOUBLE_EQ(d, 3.5);
  EXPECT_TRUE(helpers::readDouble("3786917400.25", d));
  EXPECT_DOUBLE_EQ(d, 3786917400.25);
  EXPECT_FALSE(helpers::readDouble("3.5s", d));
  EXPECT_FALSE(helpers::readDouble("True", d));
}

TEST_F(StringsHelpersTester, splitTest) {
  vector<string> tokens;
  EXPECT_EQ(helpers::split("2024-01-01T10-00-00", 'T', tokens), 2);
  EXPECT_EQ(tokens, (vector<string>{"2024-01-01", "10-00-00"}));

  EXPECT_EQ(helpers::split("NestedData//NestedDevice_32", '/', tokens, true), 2);
  EXPECT_EQ(tokens, (vector<string>{"NestedData", "NestedDevice_32"}));

  string str = "hello elle is cool lol. le bol de lait";
  vector<string> expectedTokens = {"he", "o e", "e is coo", "o", ".", "e bo", "de", "ait"};
  helpers::split(str, 'l', tokens, true, " ");
  EXPECT_EQ(tokens, expectedTokens);
}

#define CHECK_BEFORE(a, b)                    \
  EXPECT_TRUE(helpers::beforeFileName(a, b)); \
  EXPECT_FALSE(helpers::beforeFileName(b, a));

#define CHECK_SAME(a, b)                       \
  EXPECT_FALSE(helpers::beforeFileName(a, b)); \
  EXPECT_FALSE(helpers::beforeFileName(b, a));

TEST_F(StringsHelpersTester, beforeFileNameTest) {
  CHECK_BEFORE("", "a");
  CHECK_BEFORE("00", "001");
  CHECK_SAME("0", "00");
  CHECK_SAME("image010.png", "image10.png");
  CHECK_BEFORE("image10.png", "image11.png");
  CHECK_BEFORE("image90.png", "image0110.png");
  CHECK_BEFORE("Patch1_8_2024-01-01T09-00-00.bin", "Patch1_8_2024-01-01T10-00-00.bin");
}
