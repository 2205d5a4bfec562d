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

#include "Readers.h"

#include <utility>

#define DEFAULT_LOG_CHANNEL "Readers"
#include <logging/Log.h>

#include <chunkio/ChunkIndex.h>
#include <chunkio/ErrorCode.h>
#include <chunkio/HarpDecoder.h>
#include <chunkio/helpers/FileMacros.h>
#include <chunkio/helpers/Rapidjson.hpp>
#include <chunkio/helpers/Strings.h>
#include <chunkio/os/Utils.h>

using namespace std;

namespace chunkio {

namespace {

// Split one line of comma separated values. Double quotes protect commas, and "" is a quote.
vector<string> splitCsvLine(const string& line) {
  vector<string> fields;
  string field;
  bool quoted = false;
  for (size_t k = 0; k < line.size(); ++k) {
    char c = line[k];
    if (quoted) {
      if (c == '"') {
        if (k + 1 < line.size() && line[k + 1] == '"') {
          field.push_back('"');
          ++k;
        } else {
          quoted = false;
        }
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.emplace_back(std::move(field));
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  fields.emplace_back(std::move(field));
  return fields;
}

Value parseCell(const string& text) {
  if (text.empty()) {
    return {};
  }
  int64_t intValue = 0;
  if (helpers::readInt64(text, intValue)) {
    return Value(intValue);
  }
  double doubleValue = 0;
  if (helpers::readDouble(text, doubleValue)) {
    return Value(doubleValue);
  }
  if (text == "True" || text == "true" || text == "TRUE") {
    return Value(true);
  }
  if (text == "False" || text == "false" || text == "FALSE") {
    return Value(false);
  }
  return Value(text);
}

vector<string> splitLines(const string& content) {
  vector<string> lines;
  size_t start = 0;
  while (start < content.size()) {
    size_t end = content.find('\n', start);
    if (end == string::npos) {
      end = content.size();
    }
    string line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.emplace_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

// Columns of a csv file, given its number of fields per line.
// When lines have as many fields as names, the first name is the time's.
int getCsvColumns(
    const string& path,
    size_t fieldCount,
    const vector<string>& names,
    vector<string>& outColumns) {
  if (fieldCount == names.size() + 1) {
    outColumns = names;
  } else if (fieldCount == names.size() && fieldCount > 0) {
    outColumns.assign(names.begin() + 1, names.end());
  } else {
    XR_LOGE(
        "'{}' has {} fields per line, but {} columns were declared",
        path,
        fieldCount,
        names.size());
    return CSV_PARSE_ERROR;
  }
  return SUCCESS;
}

// Read a csv file with a header line, and its time in the first field.
int readCsv(const string& path, const vector<string>& names, Table& outTable) {
  string content;
  READ_OR_LOG_AND_RETURN(path, content);
  if (content.empty()) {
    outTable = Table(names, false);
    return SUCCESS;
  }
  vector<string> lines = splitLines(content);
  vector<string> columns;
  size_t fieldCount = 0;
  Table table;
  for (size_t lineIndex = 1; lineIndex < lines.size(); ++lineIndex) {
    if (helpers::trim(lines[lineIndex], " \t").empty()) {
      continue;
    }
    vector<string> fields = splitCsvLine(lines[lineIndex]);
    if (fieldCount == 0) {
      fieldCount = fields.size();
      IF_ERROR_RETURN(getCsvColumns(path, fieldCount, names, columns));
      table = Table(columns);
    } else if (fields.size() != fieldCount) {
      XR_LOGE(
          "Line {} of '{}' has {} fields instead of {}",
          lineIndex + 1,
          path,
          fields.size(),
          fieldCount);
      return CSV_PARSE_ERROR;
    }
    double seconds = 0;
    if (!helpers::readDouble(helpers::trim(fields[0]), seconds)) {
      XR_LOGE("Line {} of '{}' has an invalid time '{}'", lineIndex + 1, path, fields[0]);
      return CSV_PARSE_ERROR;
    }
    vector<Value> values;
    values.reserve(fieldCount - 1);
    for (size_t k = 1; k < fieldCount; ++k) {
      values.emplace_back(parseCell(fields[k]));
    }
    table.getRows().emplace_back(toTime(seconds), std::move(values));
  }
  if (fieldCount == 0) {
    if (lines.empty() || helpers::trim(lines[0], " \t").empty()) {
      outTable = Table(names, false);
      return SUCCESS;
    }
    // header only: its fields give the layout
    IF_ERROR_RETURN(getCsvColumns(path, splitCsvLine(lines[0]).size(), names, columns));
    table = Table(columns);
  }
  outTable = std::move(table);
  return SUCCESS;
}

} // namespace

const char* toString(ReaderType type) {
  switch (type) {
    case ReaderType::Harp:
      return "Harp";
    case ReaderType::Csv:
      return "Csv";
    case ReaderType::JsonList:
      return "JsonList";
    case ReaderType::BitmaskEvent:
      return "BitmaskEvent";
    case ReaderType::DigitalBitmask:
      return "DigitalBitmask";
    case ReaderType::Chunk:
      return "Chunk";
    case ReaderType::Metadata:
      return "Metadata";
    case ReaderType::Video:
      return "Video";
    case ReaderType::Pose:
      return "Pose";
  }
  return "Unknown";
}

int HarpReader::read(const string& path, Table& outTable) const {
  return harp::decode(path, spec_.columns, outTable);
}

int CsvReader::read(const string& path, Table& outTable) const {
  return readCsv(path, spec_.columns, outTable);
}

int JsonListReader::read(const string& path, Table& outTable) const {
  string content;
  READ_OR_LOG_AND_RETURN(path, content);
  Table table;
  vector<const JValue*> roots;
  vector<JDocument> documents;
  vector<string> lines = splitLines(content);
  documents.reserve(lines.size());
  for (size_t lineIndex = 0; lineIndex < lines.size(); ++lineIndex) {
    if (helpers::trim(lines[lineIndex], " \t").empty()) {
      continue;
    }
    documents.emplace_back();
    JDocument& document = documents.back();
    jParse(document, lines[lineIndex]);
    if (document.HasParseError() || !document.IsObject()) {
      XR_LOGE("Line {} of '{}' isn't a json object", lineIndex + 1, path);
      return JSON_PARSE_ERROR;
    }
    const auto& secondsMember = document.FindMember("seconds");
    if (secondsMember == document.MemberEnd() || !secondsMember->value.IsNumber()) {
      XR_LOGE("Line {} of '{}' has no valid 'seconds' member", lineIndex + 1, path);
      return JSON_PARSE_ERROR;
    }
    table.addRow(toTime(secondsMember->value.GetDouble()), {});
    for (const auto& member : document.GetObject()) {
      string name(member.name.GetString(), member.name.GetStringLength());
      if (name == "seconds") {
        continue;
      }
      int index = table.getColumnIndex(name);
      if (index < 0) {
        table.addColumn(name);
        index = static_cast<int>(table.getColumnCount() - 1);
      }
      table.getRows().back().values[static_cast<size_t>(index)] = jValueToValue(member.value);
    }
    const auto& rootMember = document.FindMember(rootKey_);
    roots.push_back(rootMember != document.MemberEnd() ? &rootMember->value : nullptr);
  }
  for (const string& column : spec_.columns) {
    vector<Value> values;
    values.reserve(roots.size());
    for (size_t row = 0; row < roots.size(); ++row) {
      const JValue* root = roots[row];
      if (root == nullptr || !root->IsObject() || !root->HasMember(column)) {
        XR_LOGE("Row {} of '{}' has no '{}.{}' member", row, path, rootKey_, column);
        return JSON_PARSE_ERROR;
      }
      values.emplace_back(jValueToValue((*root)[column]));
    }
    if (table.empty()) {
      table.addColumn(column);
    } else {
      table.setColumn(column, std::move(values));
    }
  }
  outTable = std::move(table);
  return SUCCESS;
}

int BitmaskEventReader::read(const string& path, Table& outTable) const {
  Table data;
  IF_ERROR_RETURN(HarpReader::read(path, data));
  outTable = Table(spec_.columns);
  for (const Row& row : data.getRows()) {
    uint64_t bits = static_cast<uint64_t>(row.values[0].getInt());
    if ((bits & value_) == value_) {
      outTable.getRows().emplace_back(row.time, vector<Value>{Value(tag_)});
    }
  }
  return SUCCESS;
}

int DigitalBitmaskReader::read(const string& path, Table& outTable) const {
  Table data;
  IF_ERROR_RETURN(HarpReader::read(path, data));
  outTable = Table(data.getColumns());
  vector<uint64_t> previous;
  for (const Row& row : data.getRows()) {
    vector<uint64_t> state;
    state.reserve(row.values.size());
    for (const Value& value : row.values) {
      state.push_back(static_cast<uint64_t>(value.getInt()) & mask_);
    }
    if (outTable.empty() || state != previous) {
      vector<Value> values;
      values.reserve(state.size());
      for (uint64_t bits : state) {
        values.emplace_back(bits != 0);
      }
      outTable.getRows().emplace_back(row.time, std::move(values));
    }
    previous = std::move(state);
  }
  return SUCCESS;
}

int ChunkReader::read(const string& path, Table& outTable) const {
  ChunkKey key;
  if (getChunkKey(path, key) != SUCCESS) {
    XR_LOGE("Can't get the chunk key of '{}'", path);
    return FILEPATH_PARSE_ERROR;
  }
  outTable = Table(spec_.columns);
  outTable.addRow(key.chunk, {Value(path), Value(key.epoch)});
  return SUCCESS;
}

int MetadataReader::read(const string& path, Table& outTable) const {
  vector<string> parts = os::getPathParts(path);
  Time epochTime;
  if (parts.size() < 2 || !parseDateTime(parts[parts.size() - 2], epochTime)) {
    XR_LOGE("Can't get the epoch time of '{}' from its folder name", path);
    return FILEPATH_PARSE_ERROR;
  }
  const string& epoch = parts[parts.size() - 2];
  string content;
  READ_OR_LOG_AND_RETURN(path, content);
  JDocument document;
  jParse(document, content);
  if (document.HasParseError() || !document.IsObject()) {
    XR_LOGE("'{}' isn't a valid metadata document", path);
    return JSON_PARSE_ERROR;
  }
  const char* kWorkflow = "Workflow";
  const char* kCommit = "Commit";
  if (!document.HasMember(kWorkflow)) {
    XR_LOGE("'{}' has no '{}' member", path, kWorkflow);
    return CONFIG_MISSING_KEY;
  }
  Value workflow = jValueToValue(document[kWorkflow]);
  Value commit = document.HasMember(kCommit) ? jValueToValue(document[kCommit]) : Value();
  Value::Map metadata;
  for (const auto& member : document.GetObject()) {
    string name(member.name.GetString(), member.name.GetStringLength());
    if (name != kWorkflow && name != kCommit) {
      metadata[name] = jValueToValue(member.value);
    }
  }
  outTable = Table(spec_.columns);
  outTable.addRow(epochTime, {workflow, commit, Value(std::move(metadata)), Value(epoch)});
  return SUCCESS;
}

int VideoReader::read(const string& path, Table& outTable) const {
  Table data;
  IF_ERROR_RETURN(readCsv(path, {"time", "hw_counter", "hw_timestamp"}, data));
  vector<string> parts = os::getPathParts(path);
  if (parts.size() < 3) {
    XR_LOGE("Can't get the epoch of '{}'", path);
    return FILEPATH_PARSE_ERROR;
  }
  if (!data.hasTimeIndex()) {
    outTable = Table(spec_.columns, false);
    return SUCCESS;
  }
  const Value videoPath(os::replaceExtension(path, ".avi"));
  const Value epoch(parts[parts.size() - 3]);
  vector<Value> frames, paths, epochs;
  for (size_t frame = 0; frame < data.size(); ++frame) {
    frames.emplace_back(static_cast<int64_t>(frame));
    paths.push_back(videoPath);
    epochs.push_back(epoch);
  }
  data.setColumn("_frame", std::move(frames));
  data.setColumn("_path", std::move(paths));
  data.setColumn("_epoch", std::move(epochs));
  outTable = std::move(data);
  return SUCCESS;
}

ReaderPtr makeSubjectReader(const string& pattern) {
  return make_shared<CsvReader>(pattern, vector<string>{"id", "weight", "event"});
}

ReaderPtr makeLogReader(const string& pattern) {
  return make_shared<CsvReader>(pattern, vector<string>{"priority", "type", "message"});
}

ReaderPtr makeHeartbeatReader(const string& pattern) {
  return make_shared<HarpReader>(pattern, vector<string>{"second"});
}

ReaderPtr makeEncoderReader(const string& pattern) {
  return make_shared<HarpReader>(pattern, vector<string>{"angle", "intensity"});
}

ReaderPtr makePositionReader(const string& pattern) {
  return make_shared<HarpReader>(
      pattern, vector<string>{"x", "y", "angle", "major", "minor", "area", "id"});
}

} // namespace chunkio
