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

#include <cerrno>

#include <gtest/gtest.h>

#include <chunkio/os/Platform.h>

#include <chunkio/ErrorCode.h>

using namespace chunkio;

namespace {

struct ErrorCodeTest : testing::Test {};

} // namespace

TEST_F(ErrorCodeTest, testErrorCode) {
  EXPECT_EQ(ErrorCode::SUCCESS, 0);

#if IS_APPLE_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 200000);
#elif IS_WINDOWS_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 1 << 29);
#elif IS_LINUX_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 1000);
#endif

  EXPECT_EQ(errorCodeToMessage(SUCCESS), "Success");
  EXPECT_EQ(errorCodeToMessage(CONFIG_NOT_FOUND), "Model config not found");
  EXPECT_EQ(errorCodeToMessage(CONFIG_UNSUPPORTED), "Unsupported model config");
  EXPECT_EQ(errorCodeToMessage(CONFIG_MISSING_KEY), "Model config is missing a required key");
  EXPECT_EQ(errorCodeToMessage(INDEX_LOOKUP_ERROR), "Time bound not found in data index");
  EXPECT_EQ(errorCodeToMessage(FRAME_DECODE_ERROR), "Binary frame decode error");
  EXPECT_EQ(
      errorCodeToMessageWithCode(INVALID_PARAMETER),
      "Invalid parameter (#" + std::to_string(INVALID_PARAMETER) + ")");
}

TEST_F(ErrorCodeTest, distinctConfigErrors) {
  EXPECT_NE(CONFIG_NOT_FOUND, CONFIG_UNSUPPORTED);
  EXPECT_NE(CONFIG_UNSUPPORTED, CONFIG_MISSING_KEY);
  EXPECT_NE(errorCodeToMessage(CONFIG_NOT_FOUND), errorCodeToMessage(CONFIG_MISSING_KEY));
}

TEST_F(ErrorCodeTest, unknownAndSystemErrors) {
  const int unknown = INDEX_LOOKUP_ERROR + 1000;
  EXPECT_EQ(errorCodeToMessage(unknown), "<Unknown error code '" + std::to_string(unknown) + "'>");
  EXPECT_FALSE(errorCodeToMessage(ENOENT).empty());
  EXPECT_EQ(errorCodeToMessage(ENOENT).find("Unknown error code"), std::string::npos);
}
