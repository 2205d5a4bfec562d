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
#include <cstdio>
#include <string>
#include <vector>

#include <chunkio/os/Platform.h>

/// Mini-OS abstraction layer.
/// Encapsulates the file system implementation, so that the rest of chunkio does not depend on
/// boost::filesystem directly.

namespace chunkio {
namespace os {

/// FILE helpers
std::FILE* fileOpen(const std::string& path, const char* modes);
int fileClose(std::FILE* file);
size_t fileRead(void* buf, size_t elementSize, size_t elementCount, std::FILE* file);
size_t fileWrite(const void* buf, size_t elementSize, size_t elementCount, std::FILE* file);

/// Read a whole file in memory.
/// @return A status code, 0 meaning success.
int readFile(const std::string& path, std::string& outContent);
/// Create or overwrite a file.
/// @return A status code, 0 meaning success.
int writeFile(const std::string& path, const void* data, size_t size);
inline int writeFile(const std::string& path, const std::string& content) {
  return writeFile(path, content.data(), content.size());
}

/// Misc helpers
int remove(const std::string& path); // file or folder, recursively
/// A folder unique to this process, created on first use, with a trailing '/'.
const std::string& getTempFolder();

/// Error helpers
int getLastFileError();
std::string fileErrorToString(int errnum);

/// Path joining helpers
std::string pathJoin(const std::string& a, const std::string& b);
std::string pathJoin(const std::string& a, const std::string& b, const std::string& c);
template <class... Args>
std::string
pathJoin(const std::string& a, const std::string& b, const std::string& c, Args... args) {
  return chunkio::os::pathJoin(chunkio::os::pathJoin(a, b, c), args...);
}

/// Create a folder and its missing parents.
int makeDirectories(const std::string& dir);

/// File path helpers
bool isDir(const std::string& path);
bool pathExists(const std::string& path);
int64_t getFileSize(const std::string& path);
/// "a/b/name.ext" -> "name.ext"
std::string getFilename(const std::string& path);
/// "a/b/name.ext" -> "name"
std::string getFileStem(const std::string& path);
/// "a/b/name.ext" -> "a/b"
std::string getParentFolder(const std::string& path);
/// "a/b/name.ext", ".avi" -> "a/b/name.avi"
std::string replaceExtension(const std::string& path, const std::string& newExtension);
/// Split a path in its components, "a/b/c" -> {"a", "b", "c"}. Root and empty parts are dropped.
std::vector<std::string> getPathParts(const std::string& path);

} // namespace os
} // namespace chunkio
