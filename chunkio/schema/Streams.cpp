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

#include "Streams.h"

#define DEFAULT_LOG_CHANNEL "Streams"
#include <logging/Log.h>

#include <chunkio/ErrorCode.h>

using namespace std;

namespace chunkio {
namespace schema {

void Stream::getStreams(vector<StreamEntry>& inOutStreams) const {
  inOutStreams.push_back({name_, reader_});
}

StreamGroup::StreamGroup(string name, const string& pattern, const vector<StreamFactory>& factories)
    : name_{std::move(name)} {
  children_.reserve(factories.size());
  for (const StreamFactory& factory : factories) {
    unique_ptr<StreamSet> child = factory(pattern);
    if (child) {
      children_.emplace_back(std::move(child));
    }
  }
}

void StreamGroup::getStreams(vector<StreamEntry>& inOutStreams) const {
  for (const auto& child : children_) {
    child->getStreams(inOutStreams);
  }
}

int Device::create(
    const string& name,
    const vector<StreamFactory>& factories,
    unique_ptr<Device>& outDevice,
    const string& path) {
  if (name.empty()) {
    XR_LOGE("Device name cannot be empty");
    return INVALID_PARAMETER;
  }
  unique_ptr<Device> device(new Device(name, path.empty() ? name : path));
  for (const StreamFactory& factory : factories) {
    unique_ptr<StreamSet> node = factory(device->pattern_);
    if (!node) {
      continue;
    }
    for (StreamEntry& entry : node->getStreams()) {
      device->streams_[entry.name] = std::move(entry.reader);
    }
    if (factories.size() == 1 && node->isStream()) {
      device->singleton_.reset(static_cast<Stream*>(node.release()));
    }
  }
  outDevice = std::move(device);
  return SUCCESS;
}

const ReaderPtr& Device::getReader() const {
  static const ReaderPtr sNoReader;
  return singleton_ ? singleton_->getReader() : sNoReader;
}

ReaderPtr Device::getStream(const string& name) const {
  auto iter = streams_.find(name);
  return iter != streams_.end() ? iter->second : nullptr;
}

} // namespace schema
} // namespace chunkio
