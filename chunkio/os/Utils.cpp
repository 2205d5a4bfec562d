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

#include "Utils.h"

#include <cerrno>
#include <cstring>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;
using fs_error_code = boost::system::error_code;
constexpr auto kNotFoundFileType = boost::filesystem::file_type::file_not_found;

using std::string;
using std::vector;

namespace chunkio {
namespace os {

FILE* fileOpen(const string& path, const char* modes) {
#if IS_WINDOWS_PLATFORM()
  return ::_wfopen(fs::path(path).wstring().c_str(), fs::path(modes).wstring().c_str());
#else
  return ::fopen(path.c_str(), modes);
#endif
}

int fileClose(FILE* file) {
  return ::fclose(file);
}

size_t fileRead(void* buf, size_t elementSize, size_t elementCount, FILE* file) {
  return ::fread(buf, elementSize, elementCount, file);
}

size_t fileWrite(const void* buf, size_t elementSize, size_t elementCount, FILE* file) {
  return ::fwrite(buf, elementSize, elementCount, file);
}

int readFile(const string& path, string& outContent) {
  outContent.clear();
  FILE* file = fileOpen(path, "rb");
  if (file == nullptr) {
    return getLastFileError();
  }
  char buffer[64 * 1024];
  size_t count = 0;
  while ((count = fileRead(buffer, 1, sizeof(buffer), file)) > 0) {
    outContent.append(buffer, count);
  }
  int error = ferror(file) != 0 ? EIO : 0;
  fileClose(file);
  return error;
}

int writeFile(const string& path, const void* data, size_t size) {
  FILE* file = fileOpen(path, "wb");
  if (file == nullptr) {
    return getLastFileError();
  }
  int error = (size > 0 && fileWrite(data, 1, size, file) != size) ? EIO : 0;
  if (fileClose(file) != 0 && error == 0) {
    error = getLastFileError();
  }
  return error;
}

int getLastFileError() {
  return errno;
}

int remove(const string& path) {
  fs_error_code ec;
  fs::remove_all(fs::path(path), ec);
  return ec.value();
}

string fileErrorToString(int errnum) {
  return strerror(errnum);
}

const string& getTempFolder() {
  static string sTempFolder = [] {
    fs_error_code code;
    fs::path folder;
    do {
      folder = fs::temp_directory_path() / fs::unique_path("chunkio-%%%%-%%%%-%%%%");
    } while (!fs::create_directory(folder, code));
    return folder.generic_string() + '/';
  }();
  return sTempFolder;
}

string pathJoin(const string& a, const string& b) {
  return (fs::path(a) / b).generic_string();
}

string pathJoin(const string& a, const string& b, const string& c) {
  return (fs::path(a) / b / c).generic_string();
}

int makeDirectories(const string& dir) {
  fs_error_code code;
  if (fs::is_directory(dir, code)) {
    return 0;
  }
  return fs::create_directories(dir, code) ? 0 : code.value();
}

bool isDir(const string& path) {
  fs_error_code ec;
  return fs::is_directory(fs::path(path), ec);
}

bool pathExists(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type(); // This will traverse symlinks
  if (ec) {
    return false; // Underlying OS API error - we cannot access it.
  }
  return type != kNotFoundFileType;
}

int64_t getFileSize(const string& path) {
  fs_error_code ec;
  auto size = fs::file_size(fs::path(path), ec);
  if (ec) {
    return -1;
  }
  return static_cast<int64_t>(size);
}

// make 'path/to/folder' and 'path/to/folder/' mean the same thing
static fs::path getCleanedPath(const string& path) {
  fs::path fspath;
  if (path.empty() || (path.back() != '/' && path.back() != '\\')) {
    fspath = path;
  } else {
    string p{path};
    do {
      p.pop_back();
    } while (!p.empty() && (p.back() == '/' || p.back() == '\\'));
    fspath = p;
  }
  return fspath;
}

string getFilename(const string& path) {
  return getCleanedPath(path).filename().generic_string();
}

string getFileStem(const string& path) {
  return getCleanedPath(path).stem().generic_string();
}

string getParentFolder(const string& path) {
  return getCleanedPath(path).parent_path().generic_string();
}

string replaceExtension(const string& path, const string& newExtension) {
  fs::path fspath = getCleanedPath(path);
  fspath.replace_extension(newExtension);
  return fspath.generic_string();
}

vector<string> getPathParts(const string& path) {
  vector<string> parts;
  for (const fs::path& part : getCleanedPath(path).relative_path()) {
    string name = part.generic_string();
    if (!name.empty() && name != "." && name != "/") {
      parts.emplace_back(std::move(name));
    }
  }
  return parts;
}

} // namespace os
} // namespace chunkio
