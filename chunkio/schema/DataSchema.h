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

enum class NodeKind {
  Dataset, ///< Data of an experiment. Nested datasets are folders of their parent dataset.
  Device, ///< A device recording files named after the device.
  Module, ///< Part of a device, recording files named after its device.
};

const char* toString(NodeKind kind);

/// Creates a reader, given the file name prefix of the node declaring it.
using ReaderFactory = std::function<ReaderPtr(const std::string& prefix)>;

/// Node of a declarative experiment data model.
///
/// A model is a tree of datasets, devices and modules. Each node knows its parent, so that the
/// file name prefix of its readers can be computed from its position in the tree:
/// - the root dataset has an empty prefix,
/// - a nested dataset adds a folder to the prefix of its parent dataset,
/// - a device appends its own name to the prefix of its dataset,
/// - a module uses the prefix of its parent.
/// Readers are declared as factories, and only created on first access.
class SchemaNode {
 public:
  /// Create the root dataset of a model.
  SchemaNode();

  SchemaNode(const SchemaNode&) = delete;
  SchemaNode& operator=(const SchemaNode&) = delete;

  /// Add a child node declared by a field. The field name is converted to PascalCase to name the
  /// child, so that "dummy_device" is named "DummyDevice".
  /// If a child with that name already exists, it is returned as is.
  SchemaNode& addField(const std::string& fieldName, NodeKind kind);
  /// Add a child node declared as a dictionary entry. The child is named after the key, verbatim.
  SchemaNode& addEntry(const std::string& key, NodeKind kind);

  /// Get a child by name, or nullptr.
  SchemaNode* getChild(const std::string& name) const;
  const std::vector<std::unique_ptr<SchemaNode>>& getChildren() const {
    return children_;
  }

  /// Declare a reader. A reader with the same name is replaced.
  void addReader(const std::string& name, ReaderFactory factory);
  /// Get a reader, creating it on first access.
  /// @return The reader, or nullptr if no reader has that name.
  ReaderPtr getReader(const std::string& name) const;
  std::vector<std::string> getReaderNames() const;

  /// File name prefix of the readers of this node.
  std::string getPrefix() const;

  NodeKind getKind() const {
    return kind_;
  }
  const std::string& getName() const {
    return name_;
  }
  const SchemaNode* getParent() const {
    return parent_;
  }

 private:
  SchemaNode(NodeKind kind, const SchemaNode* parent, std::string name);

  SchemaNode& addChild(std::string name, NodeKind kind);
  const SchemaNode* getDataset() const;

  struct ReaderSlot {
    ReaderFactory factory;
    mutable ReaderPtr reader;
  };

  const NodeKind kind_;
  const SchemaNode* const parent_;
  const std::string name_;
  std::vector<std::unique_ptr<SchemaNode>> children_;
  std::map<std::string, ReaderSlot> readers_;
};

} // namespace schema
} // namespace chunkio
