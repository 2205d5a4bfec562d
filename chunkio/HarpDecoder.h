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

#include <chunkio/Table.h>

namespace chunkio {
namespace harp {

/// Harp message payload types.
enum class PayloadType : uint8_t {
  U8 = 0x01,
  U16 = 0x02,
  U32 = 0x04,
  U64 = 0x08,
  S8 = 0x81,
  S16 = 0x82,
  S32 = 0x84,
  S64 = 0x88,
  Float = 0x44,
};

/// Flag set on the payload type of messages carrying a timestamp.
constexpr uint8_t kTimestampFlag = 0x10;
/// Timestamp sub-second ticks, in seconds.
constexpr double kTickDuration = 32e-6;

/// Byte size of one element of a payload type, or 0 for unknown types.
size_t getPayloadElementSize(uint8_t payloadType);

/// Decode a file of fixed length Harp messages. All the messages of a file must share the layout
/// of the first one.
/// The time index is the message timestamp, in seconds since the reference epoch, or the message
/// number when messages carry no timestamp.
/// @param path: path of the binary file.
/// @param columns: names of the payload elements. If empty, columns are named "0", "1", etc.
/// @param outTable: on success, one row per message.
/// @return A status code, 0 meaning success. COLUMN_COUNT_MISMATCH if the payload element count
/// doesn't match the number of columns. FRAME_DECODE_ERROR if a message has another length or
/// payload type than the first, a bad checksum, or if the file ends with a partial message.
int decode(const std::string& path, const std::vector<std::string>& columns, Table& outTable);

/// Encode one message, as written by Harp devices, for tools and tests.
/// @param payloadType: element type, without the timestamp flag.
/// @param seconds: message timestamp, in seconds since the reference epoch.
void encodeMessage(
    std::vector<uint8_t>& inOutBuffer,
    uint8_t payloadType,
    double seconds,
    const std::vector<double>& payload,
    uint8_t address = 0,
    uint8_t messageType = 3);

} // namespace harp
} // namespace chunkio
