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

#include <string>

#include <chunkio/os/Platform.h>

namespace chunkio {

#if IS_APPLE_PLATFORM()
// Largest error number is 100102 kPOSIXErrorEOPNOTSUPP
const int kPlatformUserErrorsStart = 200000;
#elif IS_WINDOWS_PLATFORM()
const int kPlatformUserErrorsStart = 1 << 29; // bit 29 is set for user errors
#else
const int kPlatformUserErrorsStart = 1000; // errno is below 200
#endif

/// Status codes returned by chunkio APIs, next to regular errno values.
enum ErrorCode : int {
  SUCCESS = 0,

  FAILURE = kPlatformUserErrorsStart,
  NOT_SUPPORTED,
  INVALID_PARAMETER,
  FILE_NOT_FOUND,
  READ_ERROR,
  FILEPATH_PARSE_ERROR,

  JSON_PARSE_ERROR,
  CSV_PARSE_ERROR,
  FRAME_DECODE_ERROR,
  COLUMN_COUNT_MISMATCH,

  CONFIG_NOT_FOUND,
  CONFIG_UNSUPPORTED,
  CONFIG_MISSING_KEY,

  INDEX_LOOKUP_ERROR,
};

/// Convert an int error code into a human readable string for logging.
/// This API should work with any int error code returned by any chunkio API.
/// @param errorCode: an error code returned by any chunkio API.
/// @return A string that describes the error.
std::string errorCodeToMessage(int errorCode);

/// Same as errorCodeToMessage(), but the numeric value of the code is appended.
std::string errorCodeToMessageWithCode(int errorCode);

} // namespace chunkio
