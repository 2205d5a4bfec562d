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

#include "FileList.h"

#include <cerrno>

#include <algorithm>
#include <filesystem>

#include <chunkio/helpers/Strings.h>

using namespace std;

namespace fs = std::filesystem;

namespace chunkio {
namespace os {

namespace {

int listFolder(const fs::path& folder, vector<string>& outFiles, vector<string>* outFolders) {
  error_code ec;
  for (fs::directory_iterator it(folder, ec), eit; it != eit; it.increment(ec)) {
    if (ec) {
      break;
    }
    fs::file_status status = it->status(ec);
    if (status.type() == fs::file_type::regular) {
      outFiles.emplace_back(it->path().generic_string());
    } else if (
        outFolders != nullptr && status.type() == fs::file_type::directory &&
        !fs::is_symlink(it->symlink_status(ec))) {
      outFolders->emplace_back(it->path().generic_string());
    }
  }
  if (ec) {
    return ec.value() != 0 ? ec.value() : EIO;
  }
  sort(outFiles.begin(), outFiles.end(), helpers::beforefileName);
  return 0;
}

int findFilesIn(
    const string& folder,
    vector<string>& inOutParts,
    const FileFilter& filter,
    vector<string>& inOutFiles) {
  vector<string> files, folders;
  int status = getFilesAndFolders(folder, files, &folders);
  if (status != 0) {
    return status;
  }
  for (string& file : files) {
    inOutParts.push_back(fs::path(file).filename().generic_string());
    if (filter(inOutParts)) {
      inOutFiles.emplace_back(std::move(file));
    }
    inOutParts.pop_back();
  }
  for (const string& subfolder : folders) {
    inOutParts.push_back(fs::path(subfolder).filename().generic_string());
    status = findFilesIn(subfolder, inOutParts, filter, inOutFiles);
    inOutParts.pop_back();
    if (status != 0) {
      return status;
    }
  }
  return 0;
}

} // namespace

int getFilesAndFolders(const string& path, vector<string>& inOutFiles, vector<string>* outFolders) {
  if (outFolders != nullptr) {
    outFolders->clear();
  }
  error_code ec;
  fs::path fspath(path);
  fs::file_status status = fs::status(fspath, ec);
  if (!fs::exists(status)) {
    return ENOENT;
  }
  if (status.type() == fs::file_type::regular) {
    inOutFiles.emplace_back(path);
    return 0;
  }
  if (status.type() != fs::file_type::directory) {
    return 0;
  }
  vector<string> files;
  int error = listFolder(fspath, files, outFolders);
  if (error != 0) {
    return error;
  }
  inOutFiles.insert(inOutFiles.end(), files.begin(), files.end());
  if (outFolders != nullptr) {
    sort(outFolders->begin(), outFolders->end(), helpers::beforefileName);
  }
  return 0;
}

int findFiles(const string& root, const FileFilter& filter, vector<string>& outFiles) {
  outFiles.clear();
  vector<string> parts;
  return findFilesIn(root, parts, filter, outFiles);
}

} // namespace os
} // namespace chunkio
