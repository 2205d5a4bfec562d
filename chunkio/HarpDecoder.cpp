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

#include "HarpDecoder.h"

#include <cmath>
#include <cstring>
#include <memory>

#define DEFAULT_LOG_CHANNEL "HarpDecoder"
#include <logging/Log.h>

#include <chunkio/ErrorCode.h>
#include <chunkio/os/Utils.h>

using namespace std;

namespace chunkio {
namespace harp {

namespace {

constexpr size_t kHeaderSize = 5; // type, length, address, port, payload type
constexpr size_t kTimestampSize = 6; // uint32 seconds + uint16 ticks

template <class T>
T readLE(const uint8_t* data) {
  T value{};
  memcpy(&value, data, sizeof(T)); // Harp messages are little endian, like our targets
  return value;
}

template <class T>
void writeLE(vector<uint8_t>& buffer, T value) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
  buffer.insert(buffer.end(), bytes, bytes + sizeof(T));
}

Value readElement(uint8_t payloadType, const uint8_t* data) {
  switch (static_cast<PayloadType>(payloadType)) {
    case PayloadType::U8:
      return Value(static_cast<int64_t>(data[0]));
    case PayloadType::U16:
      return Value(static_cast<int64_t>(readLE<uint16_t>(data)));
    case PayloadType::U32:
      return Value(static_cast<int64_t>(readLE<uint32_t>(data)));
    case PayloadType::U64:
      return Value(readLE<uint64_t>(data));
    case PayloadType::S8:
      return Value(static_cast<int64_t>(static_cast<int8_t>(data[0])));
    case PayloadType::S16:
      return Value(static_cast<int64_t>(readLE<int16_t>(data)));
    case PayloadType::S32:
      return Value(static_cast<int64_t>(readLE<int32_t>(data)));
    case PayloadType::S64:
      return Value(readLE<int64_t>(data));
    case PayloadType::Float:
      return Value(static_cast<double>(readLE<float>(data)));
  }
  return {};
}

// The last byte of a message is the sum of all the others, modulo 256.
uint8_t getChecksum(const uint8_t* message, size_t size) {
  uint8_t checksum = 0;
  for (size_t k = 0; k < size; ++k) {
    checksum = static_cast<uint8_t>(checksum + message[k]);
  }
  return checksum;
}

struct FileCloser {
  void operator()(FILE* file) const {
    os::fileClose(file);
  }
};

} // namespace

size_t getPayloadElementSize(uint8_t payloadType) {
  switch (static_cast<PayloadType>(payloadType & ~kTimestampFlag)) {
    case PayloadType::U8:
    case PayloadType::S8:
      return 1;
    case PayloadType::U16:
    case PayloadType::S16:
      return 2;
    case PayloadType::U32:
    case PayloadType::S32:
    case PayloadType::Float:
      return 4;
    case PayloadType::U64:
    case PayloadType::S64:
      return 8;
  }
  return 0;
}

int decode(const string& path, const vector<string>& columns, Table& outTable) {
  int64_t fileSize = os::getFileSize(path);
  if (fileSize < 0) {
    XR_LOGE("Can't access '{}'", path);
    return FILE_NOT_FOUND;
  }
  outTable = Table(columns);
  if (fileSize == 0) {
    return SUCCESS;
  }
  vector<uint8_t> data(static_cast<size_t>(fileSize));
  {
    unique_ptr<FILE, FileCloser> file(os::fileOpen(path, "rb"));
    if (!file) {
      int error = os::getLastFileError();
      XR_LOGE("Can't open '{}': {}", path, errorCodeToMessage(error));
      return error != 0 ? error : FILE_NOT_FOUND;
    }
    if (os::fileRead(data.data(), 1, data.size(), file.get()) != data.size()) {
      XR_LOGE("Failed to read {} bytes from '{}'", data.size(), path);
      return READ_ERROR;
    }
  }
  if (data.size() < kHeaderSize) {
    XR_LOGE("'{}' is too small for a Harp message", path);
    return FRAME_DECODE_ERROR;
  }
  const size_t stride = static_cast<size_t>(data[1]) + 2;
  const uint8_t payloadType = data[4];
  const bool hasTimestamp = (payloadType & kTimestampFlag) != 0;
  const uint8_t elementType = static_cast<uint8_t>(payloadType & ~kTimestampFlag);
  const size_t elementSize = getPayloadElementSize(payloadType);
  const size_t payloadOffset = kHeaderSize + (hasTimestamp ? kTimestampSize : 0);
  if (elementSize == 0 || stride < payloadOffset + 1) {
    XR_LOGE(
        "Invalid Harp message layout in '{}': type {:#x}, length {}", path, payloadType, stride);
    return FRAME_DECODE_ERROR;
  }
  const size_t elementCount = (stride - payloadOffset - 1) / elementSize; // last byte: checksum
  if (data.size() % stride != 0) {
    XR_LOGE(
        "'{}' ends with a partial Harp message: {} bytes for messages of {} bytes",
        path,
        data.size(),
        stride);
    return FRAME_DECODE_ERROR;
  }
  const size_t rowCount = data.size() / stride;
  vector<string> names = columns;
  if (names.empty()) {
    for (size_t k = 0; k < elementCount; ++k) {
      names.push_back(to_string(k));
    }
  } else if (names.size() != elementCount) {
    XR_LOGD(
        "'{}' has {} payload elements, but {} columns were requested",
        path,
        elementCount,
        names.size());
    return COLUMN_COUNT_MISMATCH;
  }
  outTable = Table(names);
  outTable.reserve(rowCount);
  for (size_t row = 0; row < rowCount; ++row) {
    const uint8_t* message = data.data() + row * stride;
    if (message[1] + 2u != stride || message[4] != payloadType) {
      XR_LOGE(
          "Harp message #{} in '{}' has length {} and type {:#x}, expected {} and {:#x}",
          row,
          path,
          message[1] + 2u,
          message[4],
          stride,
          payloadType);
      return FRAME_DECODE_ERROR;
    }
    if (getChecksum(message, stride - 1) != message[stride - 1]) {
      XR_LOGE("Harp message #{} in '{}' has a bad checksum", row, path);
      return FRAME_DECODE_ERROR;
    }
    Time time;
    if (hasTimestamp) {
      double seconds = readLE<uint32_t>(message + kHeaderSize) +
          readLE<uint16_t>(message + kHeaderSize + 4) * kTickDuration;
      time = toTime(seconds);
    } else {
      time = toTime(static_cast<double>(row));
    }
    vector<Value> values;
    values.reserve(elementCount);
    for (size_t k = 0; k < elementCount; ++k) {
      values.emplace_back(readElement(elementType, message + payloadOffset + k * elementSize));
    }
    outTable.getRows().emplace_back(time, std::move(values));
  }
  return SUCCESS;
}

void encodeMessage(
    vector<uint8_t>& inOutBuffer,
    uint8_t payloadType,
    double seconds,
    const vector<double>& payload,
    uint8_t address,
    uint8_t messageType) {
  const size_t elementSize = getPayloadElementSize(payloadType);
  const size_t length = kHeaderSize + kTimestampSize + payload.size() * elementSize + 1 - 2;
  const size_t start = inOutBuffer.size();
  inOutBuffer.push_back(messageType);
  inOutBuffer.push_back(static_cast<uint8_t>(length));
  inOutBuffer.push_back(address);
  inOutBuffer.push_back(255); // port
  inOutBuffer.push_back(static_cast<uint8_t>(payloadType | kTimestampFlag));
  double wholeSeconds = floor(seconds);
  writeLE<uint32_t>(inOutBuffer, static_cast<uint32_t>(wholeSeconds));
  long ticks = lround((seconds - wholeSeconds) / kTickDuration);
  writeLE<uint16_t>(inOutBuffer, static_cast<uint16_t>(ticks));
  for (double value : payload) {
    switch (static_cast<PayloadType>(payloadType)) {
      case PayloadType::U8:
        writeLE<uint8_t>(inOutBuffer, static_cast<uint8_t>(value));
        break;
      case PayloadType::U16:
        writeLE<uint16_t>(inOutBuffer, static_cast<uint16_t>(value));
        break;
      case PayloadType::U32:
        writeLE<uint32_t>(inOutBuffer, static_cast<uint32_t>(value));
        break;
      case PayloadType::U64:
        writeLE<uint64_t>(inOutBuffer, static_cast<uint64_t>(value));
        break;
      case PayloadType::S8:
        writeLE<int8_t>(inOutBuffer, static_cast<int8_t>(value));
        break;
      case PayloadType::S16:
        writeLE<int16_t>(inOutBuffer, static_cast<int16_t>(value));
        break;
      case PayloadType::S32:
        writeLE<int32_t>(inOutBuffer, static_cast<int32_t>(value));
        break;
      case PayloadType::S64:
        writeLE<int64_t>(inOutBuffer, static_cast<int64_t>(value));
        break;
      case PayloadType::Float:
        writeLE<float>(inOutBuffer, static_cast<float>(value));
        break;
    }
  }
  inOutBuffer.push_back(getChecksum(inOutBuffer.data() + start, inOutBuffer.size() - start));
}

} // namespace harp
} // namespace chunkio
