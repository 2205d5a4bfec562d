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

// Status propagation macros. XR_LOGE and the ErrorCode helpers must be reachable where used.

// Read a whole file in a string, or log the error and return it.
#define READ_OR_LOG_AND_RETURN(path_, content_)                                  \
  do {                                                                           \
    int readError_ = ::chunkio::os::readFile(path_, content_);                   \
    if (readError_ != 0) {                                                       \
      XR_LOGE("Can't read '{}': {}", path_, errorCodeToMessage(readError_));     \
      return readError_;                                                         \
    }                                                                            \
  } while (false)

// Run an operation on a file, and log the error with the file's path before returning it.
#define IF_ERROR_LOG_FILE_AND_RETURN(operation_, path_)                          \
  do {                                                                           \
    int operationError_ = operation_;                                            \
    if (operationError_ != 0) {                                                  \
      XR_LOGE(                                                                   \
          "{} failed for '{}': {}",                                              \
          #operation_,                                                           \
          path_,                                                                 \
          errorCodeToMessageWithCode(operationError_));                          \
      return operationError_;                                                    \
    }                                                                            \
  } while (false)

#define IF_ERROR_RETURN(operation_)   \
  do {                                \
    int operationError_ = operation_; \
    if (operationError_ != 0) {       \
      return operationError_;         \
    }                                 \
  } while (false)
