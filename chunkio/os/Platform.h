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

// Platform tests usable in #if expressions. Exactly one of them evaluates to 1.

#if defined(__linux__)
#define IS_LINUX_PLATFORM() 1
#else
#define IS_LINUX_PLATFORM() 0
#endif

#if defined(__APPLE__)
#define IS_APPLE_PLATFORM() 1
#else
#define IS_APPLE_PLATFORM() 0
#endif

#if defined(_WIN32)
#define IS_WINDOWS_PLATFORM() 1
#else
#define IS_WINDOWS_PLATFORM() 0
#endif

#if IS_LINUX_PLATFORM() + IS_APPLE_PLATFORM() + IS_WINDOWS_PLATFORM() != 1
#error "Unsupported platform"
#endif
