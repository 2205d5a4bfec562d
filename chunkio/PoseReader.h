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

#include <string>
#include <vector>

#include <chunkio/Readers.h>

namespace chunkio {

/// Default root of the shared pose model folders.
constexpr const char* kDefaultPoseModelRoot = "/ceph/aeon/aeon/data/processed";

/// Reader of Harp binarized pose tracking data.
/// Pose files hold one wide row per frame, whose layout depends on the tracking model: the model's
/// configuration is found using the file name, and gives the identity classes and body parts.
/// Rows are reshaped to one row per frame and body part, with the columns:
/// identity, identity_likelihood, part, x, y, part_likelihood, and model if requested.
class PoseReader : public HarpReader {
 public:
  /// @param pattern: typically "<device>_<hpcnode>_<jobid>*", or "<device>_202_*" with a register
  /// prefix. The part of file names after the pattern's last '_' names the model folder, using
  /// '_' as path separator.
  /// @param modelRoot: shared model folder root, used when the model folder isn't next to the file.
  /// @param includeModel: add a "model" column, with the model folder of each row.
  explicit PoseReader(
      std::string pattern,
      std::string modelRoot = kDefaultPoseModelRoot,
      bool includeModel = false);

  const std::string& getModelRoot() const {
    return modelRoot_;
  }
  bool getIncludeModel() const {
    return includeModel_;
  }

  int read(const std::string& path, Table& outTable) const override;

  /// Model folder of a pose file, relative to the local or shared model root.
  std::string getModelDir(const std::string& path) const;

  /// Find a model configuration file in a folder.
  /// @param configDir: the model folder.
  /// @param outConfigFile: on success, the first of the file names found in the folder.
  /// @param configFileNames: candidate file names, by order of preference.
  /// @return A status code, 0 meaning success. CONFIG_NOT_FOUND if no file was found.
  static int getConfigFile(
      const std::string& configDir,
      std::string& outConfigFile,
      const std::vector<std::string>& configFileNames = {"confmap_config.json"});

  /// Get the identity classes of a model configuration file.
  /// @param outClasses: the class names, or an empty list if the model doesn't have classes.
  /// @return A status code, 0 meaning success. CONFIG_UNSUPPORTED if the file isn't a known model
  /// configuration, CONFIG_MISSING_KEY if the configuration has no model heads.
  static int getClassNames(const std::string& configFile, std::vector<std::string>& outClasses);

  /// Get the body parts of a model configuration file: the anchor part, prefixed with "anchor_",
  /// followed by the part names.
  /// @return A status code, 0 meaning success. CONFIG_MISSING_KEY if the anchor part or the part
  /// names can't be found.
  static int getBodyParts(const std::string& configFile, std::vector<std::string>& outParts);

  /// Replace integer identities by their class name, when the class is known.
  /// Does nothing if there are no classes.
  static void classIntToString(Table& inOutTable, const std::vector<std::string>& classes);

 private:
  const std::string modelRoot_;
  const bool includeModel_;
  const size_t patternOffset_;
};

} // namespace chunkio
