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
#include <vector>

#include <chunkio/Table.h>

namespace chunkio {

/// Kinds of readers, to tell readers apart without casting.
enum class ReaderType {
  Harp,
  Csv,
  JsonList,
  BitmaskEvent,
  DigitalBitmask,
  Chunk,
  Metadata,
  Video,
  Pose,
};

const char* toString(ReaderType type);

/// How to find the files of a data stream, and what columns they hold.
struct ReaderSpec {
  /// Wildcard pattern of the file names, without extension, usually "<Device>_<Stream>_*".
  std::string pattern;
  /// Columns of the tables read.
  std::vector<std::string> columns;
  /// File name extension, without the dot.
  std::string extension;
};

/// Decoder of the data files of one stream.
/// Readers are immutable once constructed, and can be shared.
class Reader {
 public:
  Reader(ReaderType type, ReaderSpec spec) : type_{type}, spec_{std::move(spec)} {}
  virtual ~Reader() = default;

  ReaderType getType() const {
    return type_;
  }
  const ReaderSpec& getSpec() const {
    return spec_;
  }
  const std::string& getPattern() const {
    return spec_.pattern;
  }
  const std::vector<std::string>& getColumns() const {
    return spec_.columns;
  }
  const std::string& getExtension() const {
    return spec_.extension;
  }

  /// Read a data file.
  /// @param path: path of the file to read.
  /// @param outTable: on success, the data of the file.
  /// @return A status code, 0 meaning success.
  virtual int read(const std::string& path, Table& outTable) const = 0;

 protected:
  const ReaderType type_;
  const ReaderSpec spec_;
};

using ReaderPtr = std::shared_ptr<const Reader>;

} // namespace chunkio
