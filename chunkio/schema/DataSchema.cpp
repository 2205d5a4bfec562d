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

#include "DataSchema.h"

#define DEFAULT_LOG_CHANNEL "DataSchema"
#include <logging/Log.h>
#include <logging/Verify.h>

#include <chunkio/helpers/Strings.h>
#include <chunkio/os/Utils.h>

using namespace std;

namespace chunkio {
namespace schema {

const char* toString(NodeKind kind) {
  switch (kind) {
    case NodeKind::Dataset:
      return "Dataset";
    case NodeKind::Device:
      return "Device";
    case NodeKind::Module:
      return "Module";
  }
  return "Unknown";
}

SchemaNode::SchemaNode() : SchemaNode(NodeKind::Dataset, nullptr, {}) {}

SchemaNode::SchemaNode(NodeKind kind, const SchemaNode* parent, string name)
    : kind_{kind}, parent_{parent}, name_{std::move(name)} {}

SchemaNode& SchemaNode::addField(const string& fieldName, NodeKind kind) {
  return addChild(helpers::toPascalCase(fieldName), kind);
}

SchemaNode& SchemaNode::addEntry(const string& key, NodeKind kind) {
  return addChild(key, kind);
}

SchemaNode& SchemaNode::addChild(string name, NodeKind kind) {
  SchemaNode* child = getChild(name);
  if (child != nullptr) {
    XR_VERIFY(
        child->kind_ == kind,
        "{} '{}' already declared as {}",
        toString(kind),
        name,
        toString(child->kind_));
    return *child;
  }
  children_.emplace_back(new SchemaNode(kind, this, std::move(name)));
  return *children_.back();
}

SchemaNode* SchemaNode::getChild(const string& name) const {
  for (const auto& child : children_) {
    if (child->name_ == name) {
      return child.get();
    }
  }
  return nullptr;
}

void SchemaNode::addReader(const string& name, ReaderFactory factory) {
  ReaderSlot& slot = readers_[name];
  slot.factory = std::move(factory);
  slot.reader.reset();
}

ReaderPtr SchemaNode::getReader(const string& name) const {
  auto iter = readers_.find(name);
  if (iter == readers_.end()) {
    XR_LOGD("No reader '{}' in {} '{}'", name, toString(kind_), name_);
    return nullptr;
  }
  const ReaderSlot& slot = iter->second;
  if (!slot.reader && slot.factory) {
    slot.reader = slot.factory(getPrefix());
  }
  return slot.reader;
}

vector<string> SchemaNode::getReaderNames() const {
  vector<string> names;
  names.reserve(readers_.size());
  for (const auto& reader : readers_) {
    names.push_back(reader.first);
  }
  return names;
}

const SchemaNode* SchemaNode::getDataset() const {
  const SchemaNode* node = parent_;
  while (node != nullptr && node->kind_ != NodeKind::Dataset) {
    node = node->parent_;
  }
  return node;
}

string SchemaNode::getPrefix() const {
  switch (kind_) {
    case NodeKind::Dataset:
    case NodeKind::Device: {
      const SchemaNode* dataset = getDataset();
      string datasetPrefix = dataset != nullptr ? dataset->getPrefix() : string();
      return datasetPrefix.empty() ? name_ : os::pathJoin(datasetPrefix, name_);
    }
    case NodeKind::Module:
      return parent_ != nullptr ? parent_->getPrefix() : string();
  }
  return {};
}

} // namespace schema
} // namespace chunkio
