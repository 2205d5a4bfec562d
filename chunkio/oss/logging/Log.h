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

#include <fmt/core.h>

namespace chunkio {
namespace logging {

enum class Level {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
};

/// Logging backend: redirect where you need, depending on the log level and your preferences.
void log(Level level, const char* channel, const std::string& message);

/// Set the most verbose level that will be printed. Messages above that level are dropped.
/// Default: Level::Info.
void setMaxLevel(Level level);
Level getMaxLevel();

} // namespace logging
} // namespace chunkio

#ifdef DEFAULT_LOG_CHANNEL
#define XR_LOG_DEFAULT(level, ...) \
  chunkio::logging::log(level, DEFAULT_LOG_CHANNEL, fmt::format(__VA_ARGS__))

#define XR_LOGD(...) XR_LOG_DEFAULT(chunkio::logging::Level::Debug, __VA_ARGS__)
#define XR_LOGI(...) XR_LOG_DEFAULT(chunkio::logging::Level::Info, __VA_ARGS__)
#define XR_LOGW(...) XR_LOG_DEFAULT(chunkio::logging::Level::Warning, __VA_ARGS__)
#define XR_LOGE(...) XR_LOG_DEFAULT(chunkio::logging::Level::Error, __VA_ARGS__)
#endif

#define XR_LOG_CHANNEL(level, channel, ...) \
  chunkio::logging::log(level, channel, fmt::format(__VA_ARGS__))

#define XR_LOGCD(CHANNEL, ...) XR_LOG_CHANNEL(chunkio::logging::Level::Debug, CHANNEL, __VA_ARGS__)
#define XR_LOGCI(CHANNEL, ...) XR_LOG_CHANNEL(chunkio::logging::Level::Info, CHANNEL, __VA_ARGS__)
#define XR_LOGCW(CHANNEL, ...) \
  XR_LOG_CHANNEL(chunkio::logging::Level::Warning, CHANNEL, __VA_ARGS__)
#define XR_LOGCE(CHANNEL, ...) XR_LOG_CHANNEL(chunkio::logging::Level::Error, CHANNEL, __VA_ARGS__)
