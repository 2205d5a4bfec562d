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

#include "PoseReader.h"

#include <algorithm>
#include <cmath>

#define DEFAULT_LOG_CHANNEL "PoseReader"
#include <logging/Log.h>

#include <chunkio/ErrorCode.h>
#include <chunkio/HarpDecoder.h>
#include <chunkio/helpers/FileMacros.h>
#include <chunkio/helpers/Rapidjson.hpp>
#include <chunkio/os/Utils.h>

using namespace std;

namespace chunkio {

namespace {

const char* kSleapConfigStem = "confmap_config";

vector<string> getPoseColumns(bool includeModel) {
  vector<string> columns{"identity", "identity_likelihood", "part", "x", "y", "part_likelihood"};
  if (includeModel) {
    columns.emplace_back("model");
  }
  return columns;
}

void addPartColumns(const vector<string>& parts, vector<string>& inOutColumns) {
  for (const string& part : parts) {
    inOutColumns.push_back(part + "_x");
    inOutColumns.push_back(part + "_y");
    inOutColumns.push_back(part + "_likelihood");
  }
}

int loadConfig(const string& configFile, JDocument& outDocument) {
  string content;
  READ_OR_LOG_AND_RETURN(configFile, content);
  jParse(outDocument, content);
  if (outDocument.HasParseError() || !outDocument.IsObject()) {
    XR_LOGE("Model config '{}' isn't a valid json document", configFile);
    return JSON_PARSE_ERROR;
  }
  return SUCCESS;
}

const JValue* getHeads(const JDocument& config) {
  const auto& model = config.FindMember("model");
  if (model == config.MemberEnd() || !model->value.IsObject()) {
    return nullptr;
  }
  const auto& heads = model->value.FindMember("heads");
  return heads != model->value.MemberEnd() ? &heads->value : nullptr;
}

} // namespace

PoseReader::PoseReader(string pattern, string modelRoot, bool includeModel)
    : HarpReader(ReaderType::Pose, {std::move(pattern), getPoseColumns(includeModel), "bin"}),
      modelRoot_{std::move(modelRoot)},
      includeModel_{includeModel},
      patternOffset_{spec_.pattern.rfind('_') + 1} {}

string PoseReader::getModelDir(const string& path) const {
  string stem = os::getFileStem(path);
  string modelPath = stem.substr(min(patternOffset_, stem.size()));
  replace(modelPath.begin(), modelPath.end(), '_', '/');
  string modelDir = os::getParentFolder(modelPath);
  return modelDir.empty() ? "." : modelDir;
}

int PoseReader::read(const string& path, Table& outTable) const {
  const string modelDir = getModelDir(path);
  const string localDir = os::pathJoin(os::getParentFolder(path), modelDir);
  const string sharedDir = os::pathJoin(modelRoot_, modelDir);
  string configDir;
  if (os::pathExists(localDir)) {
    configDir = localDir;
  } else if (os::pathExists(sharedDir)) {
    configDir = sharedDir;
  } else {
    XR_LOGE(
        "Cannot find model dir in either local ({}) or shared ({}) directories",
        localDir,
        sharedDir);
    return CONFIG_NOT_FOUND;
  }
  string configFile;
  IF_ERROR_RETURN(getConfigFile(configDir, configFile));
  vector<string> classes, parts;
  IF_ERROR_RETURN(getClassNames(configFile, classes));
  IF_ERROR_RETURN(getBodyParts(configFile, parts));

  // Older models have a single identity likelihood, newer ones have one per class.
  vector<string> columns{"identity", "identity_likelihood"};
  addPartColumns(parts, columns);
  Table data;
  int status = harp::decode(path, columns, data);
  bool perClassLikelihood = false;
  if (status == COLUMN_COUNT_MISMATCH) {
    perClassLikelihood = true;
    columns = {"identity"};
    for (const string& className : classes) {
      columns.push_back(className + "_likelihood");
    }
    addPartColumns(parts, columns);
    status = harp::decode(path, columns, data);
  }
  if (status != 0) {
    XR_LOGE("Can't read pose data from '{}': {}", path, errorCodeToMessage(status));
    return status;
  }

  if (perClassLikelihood) {
    Table collapsed(vector<string>{"identity", "identity_likelihood"});
    const vector<string>& dataColumns = data.getColumns();
    for (size_t k = 1 + classes.size(); k < dataColumns.size(); ++k) {
      collapsed.addColumn(dataColumns[k]);
    }
    collapsed.reserve(data.size());
    for (Row& row : data.getRows()) {
      Value::Map likelihoods;
      for (size_t c = 0; c < classes.size(); ++c) {
        likelihoods[classes[c]] = row.values[1 + c];
      }
      vector<Value> values;
      values.reserve(collapsed.getColumnCount());
      values.push_back(std::move(row.values[0]));
      values.emplace_back(std::move(likelihoods));
      values.insert(values.end(), row.values.begin() + 1 + classes.size(), row.values.end());
      collapsed.getRows().emplace_back(row.time, std::move(values));
    }
    data = std::move(collapsed);
  }

  classIntToString(data, classes);

  Table result(spec_.columns);
  result.reserve(data.size() * parts.size());
  const Value model(modelDir);
  for (const Row& row : data.getRows()) {
    for (size_t p = 0; p < parts.size(); ++p) {
      vector<Value> values{
          row.values[0],
          row.values[1],
          Value(parts[p]),
          row.values[2 + p * 3],
          row.values[3 + p * 3],
          row.values[4 + p * 3]};
      if (includeModel_) {
        values.push_back(model);
      }
      result.getRows().emplace_back(row.time, std::move(values));
    }
  }
  outTable = std::move(result);
  return SUCCESS;
}

int PoseReader::getConfigFile(
    const string& configDir,
    string& outConfigFile,
    const vector<string>& configFileNames) {
  for (const string& name : configFileNames) {
    string candidate = os::pathJoin(configDir, name);
    if (os::pathExists(candidate)) {
      outConfigFile = candidate;
      return SUCCESS;
    }
  }
  XR_LOGE("Cannot find config file in {}", configDir);
  return CONFIG_NOT_FOUND;
}

int PoseReader::getClassNames(const string& configFile, vector<string>& outClasses) {
  outClasses.clear();
  if (os::getFileStem(configFile) != kSleapConfigStem) {
    XR_LOGE("The model config file '{}' is not supported.", configFile);
    return CONFIG_UNSUPPORTED;
  }
  JDocument config;
  IF_ERROR_RETURN(loadConfig(configFile, config));
  const JValue* heads = getHeads(config);
  if (heads == nullptr) {
    XR_LOGE("Cannot find class_vectors in {}.", configFile);
    return CONFIG_MISSING_KEY;
  }
  const JValue* classVectors = findNestedJMember(*heads, "class_vectors");
  if (classVectors == nullptr) {
    return SUCCESS;
  }
  if (!classVectors->IsObject() || !classVectors->HasMember("classes") ||
      !getJStringVector((*classVectors)["classes"], outClasses)) {
    XR_LOGE("Cannot find class_vectors in {}.", configFile);
    return CONFIG_MISSING_KEY;
  }
  return SUCCESS;
}

int PoseReader::getBodyParts(const string& configFile, vector<string>& outParts) {
  outParts.clear();
  if (os::getFileStem(configFile) != kSleapConfigStem) {
    return SUCCESS;
  }
  JDocument config;
  IF_ERROR_RETURN(loadConfig(configFile, config));
  const JValue* heads = getHeads(config);
  const JValue* anchor = heads != nullptr ? findNestedJMember(*heads, "anchor_part") : nullptr;
  const JValue* partNames = heads != nullptr ? findNestedJMember(*heads, "part_names") : nullptr;
  vector<string> names;
  if (anchor == nullptr || partNames == nullptr || !getJStringVector(*partNames, names)) {
    XR_LOGE("Cannot find anchor or bodyparts in {}.", configFile);
    return CONFIG_MISSING_KEY;
  }
  string anchorName = anchor->IsString() ? string(anchor->GetString(), anchor->GetStringLength())
                                         : jValueToValue(*anchor).toString();
  outParts.push_back("anchor_" + anchorName);
  outParts.insert(outParts.end(), names.begin(), names.end());
  return SUCCESS;
}

void PoseReader::classIntToString(Table& inOutTable, const vector<string>& classes) {
  int identity = inOutTable.getColumnIndex("identity");
  if (classes.empty() || identity < 0) {
    return;
  }
  for (Row& row : inOutTable.getRows()) {
    Value& value = row.values[static_cast<size_t>(identity)];
    if (!value.isNumber()) {
      continue;
    }
    double code = value.getDouble();
    if (code >= 0 && code < static_cast<double>(classes.size()) && floor(code) == code) {
      value = Value(classes[static_cast<size_t>(code)]);
    }
  }
}

} // namespace chunkio
