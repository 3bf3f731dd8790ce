/*
    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
*/

#include <Exceptions/StateCorruptionException.hpp>
#include <State/ByteCodec.hpp>
#include <State/SpillRecord.hpp>
#include <string_view>

namespace DFE::State {

namespace {
constexpr std::string_view MAGIC = "DFES";
constexpr size_t CHECKSUM_SIZE = sizeof(uint64_t);
}// namespace

SpillRecord::SpillRecord(std::string keyBytes, Windowing::Window window, std::string valueBytes)
    : keyBytes(std::move(keyBytes)), window(window), valueBytes(std::move(valueBytes)) {}

std::string SpillRecord::encode() const {
    ByteWriter writer;
    writer.writeRaw(MAGIC);
    writer.writeUInt8(VERSION);
    writer.writeUInt64(window.getStart());
    writer.writeUInt64(window.getEnd());
    writer.writeBytes(keyBytes);
    writer.writeBytes(valueBytes);
    writer.writeUInt64(fnv1a(writer.getBuffer()));
    return writer.release();
}

SpillRecord SpillRecord::decode(const std::string& bytes) {
    if (bytes.size() < MAGIC.size() + 1 + CHECKSUM_SIZE) {
        throw Exceptions::StateCorruptionException("spill record of " + std::to_string(bytes.size()) + " bytes is too short");
    }
    std::string_view payload(bytes.data(), bytes.size() - CHECKSUM_SIZE);
    ByteReader checksumReader(std::string_view(bytes).substr(payload.size()));
    if (checksumReader.readUInt64() != fnv1a(payload)) {
        throw Exceptions::StateCorruptionException("spill record checksum mismatch");
    }

    ByteReader reader(payload);
    if (reader.readRaw(MAGIC.size()) != MAGIC) {
        throw Exceptions::StateCorruptionException("spill record has an invalid magic");
    }
    auto version = reader.readUInt8();
    if (version != VERSION) {
        throw Exceptions::StateCorruptionException("unsupported spill record version " + std::to_string(version));
    }
    auto start = reader.readUInt64();
    auto end = reader.readUInt64();
    if (start >= end) {
        throw Exceptions::StateCorruptionException("spill record holds the invalid window [" + std::to_string(start) + ", "
                                                   + std::to_string(end) + ")");
    }
    auto keyBytes = reader.readBytes();
    auto valueBytes = reader.readBytes();
    if (reader.remaining() != 0) {
        throw Exceptions::StateCorruptionException("spill record has " + std::to_string(reader.remaining()) + " trailing bytes");
    }
    return {std::move(keyBytes), Windowing::Window(start, end), std::move(valueBytes)};
}

}// namespace DFE::State
