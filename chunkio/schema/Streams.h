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
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <chunkio/Reader.h>

namespace chunkio {
namespace schema {

/// A named data stream, and its reader.
struct StreamEntry {
  std::string name;
  ReaderPtr reader;
};

/// Node of a stream tree: a single stream, or a group of streams.
class StreamSet {
 public:
  virtual ~StreamSet() = default;

  /// Tell if this node is a single stream.
  virtual bool isStream() const = 0;

  /// Append the streams of this node, depth first. Stream names are never prefixed.
  virtual void getStreams(std::vector<StreamEntry>& inOutStreams) const = 0;

  std::vector<StreamEntry> getStreams() const {
    std::vector<StreamEntry> streams;
    getStreams(streams);
    return streams;
  }
};

/// Creates a stream tree node for a pattern, which is the pattern of the device, or of the
/// group the node is part of.
using StreamFactory = std::function<std::unique_ptr<StreamSet>(const std::string& pattern)>;

/// A single named stream.
class Stream : public StreamSet {
 public:
  Stream(std::string name, ReaderPtr reader) : name_{std::move(name)}, reader_{std::move(reader)} {}

  bool isStream() const override {
    return true;
  }
  using StreamSet::getStreams;
  void getStreams(std::vector<StreamEntry>& inOutStreams) const override;

  const std::string& getName() const {
    return name_;
  }
  const ReaderPtr& getReader() const {
    return reader_;
  }

 private:
  const std::string name_;
  const ReaderPtr reader_;
};

/// An ordered group of streams and groups, all created using the same pattern.
class StreamGroup : public StreamSet {
 public:
  StreamGroup(
      std::string name,
      const std::string& pattern,
      const std::vector<StreamFactory>& factories);

  bool isStream() const override {
    return false;
  }
  using StreamSet::getStreams;
  void getStreams(std::vector<StreamEntry>& inOutStreams) const override;

  const std::string& getName() const {
    return name_;
  }

 private:
  const std::string name_;
  std::vector<std::unique_ptr<StreamSet>> children_;
};

/// Root of a stream tree, which gives the tree its pattern.
/// A device made of a single stream is that stream.
class Device {
 public:
  /// Create a device.
  /// @param name: the device name.
  /// @param factories: the streams and groups of the device.
  /// @param outDevice: on success, the device.
  /// @param path: pattern given to the factories. If empty, the device name is used.
  /// @return A status code, 0 meaning success. INVALID_PARAMETER if the name is empty.
  static int create(
      const std::string& name,
      const std::vector<StreamFactory>& factories,
      std::unique_ptr<Device>& outDevice,
      const std::string& path = {});

  const std::string& getName() const {
    return name_;
  }
  const std::string& getPattern() const {
    return pattern_;
  }

  /// Tell if the device is made of a single stream.
  bool isSingleton() const {
    return singleton_ != nullptr;
  }
  /// Reader of a singleton device, or nullptr.
  const ReaderPtr& getReader() const;

  /// Readers of all the streams of the device, by stream name.
  const std::map<std::string, ReaderPtr>& getStreams() const {
    return streams_;
  }
  /// Reader of a stream, or nullptr if there is no such stream.
  ReaderPtr getStream(const std::string& name) const;

 private:
  Device(std::string name, std::string pattern)
      : name_{std::move(name)}, pattern_{std::move(pattern)} {}

  const std::string name_;
  const std::string pattern_;
  std::map<std::string, ReaderPtr> streams_;
  std::unique_ptr<Stream> singleton_;
};

} // namespace schema
} // namespace chunkio
