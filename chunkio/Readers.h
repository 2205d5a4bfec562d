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
#include <string>
#include <vector>

#include <chunkio/Reader.h>

namespace chunkio {

/// Reader of Harp binary files. Each payload element is a column.
class HarpReader : public Reader {
 public:
  HarpReader(std::string pattern, std::vector<std::string> columns, std::string extension = "bin")
      : Reader(ReaderType::Harp, {std::move(pattern), std::move(columns), std::move(extension)}) {}

  int read(const std::string& path, Table& outTable) const override;

 protected:
  HarpReader(ReaderType type, ReaderSpec spec) : Reader(type, std::move(spec)) {}
};

/// Reader of comma separated text files, with a header line.
/// The first field of each line is the time, in seconds since the reference epoch.
/// Cells are read as integers, floating point numbers or text, and empty cells are missing.
/// Empty files give a table without rows and without time index.
class CsvReader : public Reader {
 public:
  CsvReader(std::string pattern, std::vector<std::string> columns, std::string extension = "csv")
      : Reader(ReaderType::Csv, {std::move(pattern), std::move(columns), std::move(extension)}) {}

  int read(const std::string& path, Table& outTable) const override;

 protected:
  CsvReader(ReaderType type, ReaderSpec spec) : Reader(type, std::move(spec)) {}
};

/// Reader of files with one json object per line, timed by their "seconds" member.
/// Every other member becomes a column, and each extracted column is read from the object
/// stored under the root key.
class JsonListReader : public Reader {
 public:
  JsonListReader(
      std::string pattern,
      std::vector<std::string> columns = {},
      std::string rootKey = "value",
      std::string extension = "jsonl")
      : Reader(
            ReaderType::JsonList,
            {std::move(pattern), std::move(columns), std::move(extension)}),
        rootKey_{std::move(rootKey)} {}

  const std::string& getRootKey() const {
    return rootKey_;
  }

  int read(const std::string& path, Table& outTable) const override;

 private:
  const std::string rootKey_;
};

/// Reader of digital events: keeps the messages with all the bits of a value set, and labels
/// them with a tag, in the "event" column.
class BitmaskEventReader : public HarpReader {
 public:
  BitmaskEventReader(std::string pattern, uint64_t value, std::string tag)
      : HarpReader(ReaderType::BitmaskEvent, {std::move(pattern), {"event"}, "bin"}),
        value_{value},
        tag_{std::move(tag)} {}

  int read(const std::string& path, Table& outTable) const override;

 private:
  const uint64_t value_;
  const std::string tag_;
};

/// Reader of digital lines: masks the payload, and keeps the first message and the messages
/// where the masked state changes, reporting the state as a boolean.
class DigitalBitmaskReader : public HarpReader {
 public:
  DigitalBitmaskReader(std::string pattern, uint64_t mask, std::vector<std::string> columns)
      : HarpReader(ReaderType::DigitalBitmask, {std::move(pattern), std::move(columns), "bin"}),
        mask_{mask} {}

  int read(const std::string& path, Table& outTable) const override;

 private:
  const uint64_t mask_;
};

/// Catalogs chunk files: each file gives one row, timed by its chunk, with its path and epoch.
class ChunkReader : public Reader {
 public:
  ChunkReader(std::string pattern, std::string extension)
      : Reader(ReaderType::Chunk, {std::move(pattern), {"path", "epoch"}, std::move(extension)}) {}
  /// Catalog the files of another reader.
  explicit ChunkReader(const Reader& reader)
      : ChunkReader(reader.getPattern(), reader.getExtension()) {}

  int read(const std::string& path, Table& outTable) const override;
};

/// Reader of epoch metadata documents: one json document per epoch folder, which names the
/// epoch's start time.
/// The document's required "Workflow" and optional "Commit" members get their own column, and
/// the rest of the document goes in the "metadata" column.
class MetadataReader : public Reader {
 public:
  explicit MetadataReader(std::string pattern = "Metadata")
      : Reader(
            ReaderType::Metadata,
            {std::move(pattern), {"workflow", "commit", "metadata", "epoch"}, "yml"}) {}

  int read(const std::string& path, Table& outTable) const override;
};

/// Reader of video frame metadata: frame time, hardware counter and timestamp.
/// Adds the frame number in the file, the video file path, and the epoch of each frame.
class VideoReader : public CsvReader {
 public:
  explicit VideoReader(std::string pattern)
      : CsvReader(
            ReaderType::Video,
            {std::move(pattern),
             {"hw_counter", "hw_timestamp", "_frame", "_path", "_epoch"},
             "csv"}) {}

  int read(const std::string& path, Table& outTable) const override;
};

/// Fixed layout readers.
/// Subject events: id, weight, event.
ReaderPtr makeSubjectReader(const std::string& pattern);
/// Message log: priority, type, message.
ReaderPtr makeLogReader(const std::string& pattern);
/// Heartbeat: the whole second of each beat.
ReaderPtr makeHeartbeatReader(const std::string& pattern);
/// Magnetic encoder: angle, intensity.
ReaderPtr makeEncoderReader(const std::string& pattern);
/// 2D position tracking: x, y, angle, major, minor, area, id.
ReaderPtr makePositionReader(const std::string& pattern);

} // namespace chunkio
