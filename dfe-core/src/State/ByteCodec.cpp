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
#include <limits>

namespace DFE::State {

void ByteWriter::writeUInt8(uint8_t value) { buffer.push_back(static_cast<char>(value)); }

void ByteWriter::writeUInt32(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void ByteWriter::writeUInt64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void ByteWriter::writeBytes(std::string_view bytes) {
    if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
        throw Exceptions::RuntimeException("value of " + std::to_string(bytes.size()) + " bytes is too large to be encoded");
    }
    writeUInt32(static_cast<uint32_t>(bytes.size()));
    writeRaw(bytes);
}

void ByteWriter::writeRaw(std::string_view bytes) { buffer.append(bytes.data(), bytes.size()); }

void ByteReader::require(size_t length) const {
    if (remaining() < length) {
        throw Exceptions::StateCorruptionException("truncated buffer: expected " + std::to_string(length)
                                                   + " more bytes at offset " + std::to_string(position) + " but found "
                                                   + std::to_string(remaining()));
    }
}

uint8_t ByteReader::readUInt8() {
    require(1);
    return static_cast<uint8_t>(buffer[position++]);
}

uint32_t ByteReader::readUInt32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<uint8_t>(buffer[position++])) << (8 * i);
    }
    return value;
}

uint64_t ByteReader::readUInt64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(buffer[position++])) << (8 * i);
    }
    return value;
}

std::string ByteReader::readBytes() {
    auto length = readUInt32();
    return readRaw(length);
}

std::string ByteReader::readRaw(size_t length) {
    require(length);
    std::string bytes(buffer.substr(position, length));
    position += length;
    return bytes;
}

uint64_t fnv1a(std::string_view bytes) {
    constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;
    uint64_t hash = FNV_OFFSET_BASIS;
    for (auto byte : bytes) {
        hash ^= static_cast<uint8_t>(byte);
        hash *= FNV_PRIME;
    }
    return hash;
}

}// namespace DFE::State
