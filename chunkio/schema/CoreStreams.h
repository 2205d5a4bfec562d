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

#include <memory>
#include <string>

#include <chunkio/schema/Streams.h>

namespace chunkio {
namespace schema {

/// Streams common to most experiments. Each one derives its reader's file pattern from the pattern
/// of its device, and can be used as a StreamFactory.

/// Heartbeat event data: "<pattern>_8_*".
std::unique_ptr<StreamSet> heartbeat(const std::string& pattern);
/// Video frame metadata: "<pattern>_*".
std::unique_ptr<StreamSet> video(const std::string& pattern);
/// 2D position tracking: "<pattern>_200_*".
std::unique_ptr<StreamSet> position(const std::string& pattern);
/// Magnetic encoder data: "<pattern>_90_*".
std::unique_ptr<StreamSet> encoder(const std::string& pattern);
/// Environment state: "<pattern>_EnvironmentState_*".
std::unique_ptr<StreamSet> environmentState(const std::string& pattern);
/// Subjects entering and leaving: "<pattern>_SubjectState_*".
std::unique_ptr<StreamSet> subjectState(const std::string& pattern);
/// Message log: "<pattern>_MessageLog_*".
std::unique_ptr<StreamSet> messageLog(const std::string& pattern);
/// Epoch metadata: "<pattern>".
std::unique_ptr<StreamSet> metadata(const std::string& pattern);
/// Pose tracking: "<pattern>_202_*".
std::unique_ptr<StreamSet> pose(const std::string& pattern);
/// Environment state and subject state.
std::unique_ptr<StreamSet> environment(const std::string& pattern);

} // namespace schema
} // namespace chunkio
