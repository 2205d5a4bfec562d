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

#include <functional>
#include <string>
#include <vector>

namespace chunkio {
namespace os {

/// Get the files of a folder, and maybe its subfolders, both sorted in file name order.
/// @param path: the folder to list, or a single file.
/// @param inOutFiles: the files found are appended to this list.
/// @param outFolders: if provided, set to the subfolders found. Symbolic links are skipped.
/// @return A status code, 0 meaning success.
int getFilesAndFolders(
    const std::string& path,
    std::vector<std::string>& inOutFiles,
    std::vector<std::string>* outFolders = nullptr);

/// Tell if a file should be kept, given its path relative to the searched folder, as parts.
using FileFilter = std::function<bool(const std::vector<std::string>& relativeParts)>;

/// Find the files under a folder that a filter accepts, with no depth limit.
/// Each folder's own files are visited first, then each of its subfolders, in file name order.
/// @param outFiles: set to the full paths of the files kept.
/// @return A status code, 0 meaning success.
int findFiles(
    const std::string& root,
    const FileFilter& filter,
    std::vector<std::string>& outFiles);

} // namespace os
} // namespace chunkio
