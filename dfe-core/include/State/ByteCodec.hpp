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

#ifndef DFE_CORE_INCLUDE_STATE_BYTECODEC_HPP_
#define DFE_CORE_INCLUDE_STATE_BYTECODEC_HPP_

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace DFE::State {

/**
 * @brief Appends fixed width little endian integers and length prefixed byte strings to a buffer.
 */
class ByteWriter {
  public:
    void writeUInt8(uint8_t value);
    void writeUInt32(uint32_t value);
    void writeUInt64(uint64_t value);

    /**
     * @brief Writes the length of bytes as uint32 followed by the bytes.
     */
    void writeBytes(std::string_view bytes);

    /**
     * @brief Writes the bytes without a length prefix.
     */
    void writeRaw(std::string_view bytes);

    [[nodiscard]] const std::string& getBuffer() const { return buffer; }

    std::string release() { return std::move(buffer); }

  private:
    std::string buffer;
};

/**
 * @brief Reads values written by ByteWriter.
 * Reading past the end of the buffer throws a StateCorruptionException.
 */
class ByteReader {
  public:
    explicit ByteReader(std::string_view buffer) : buffer(buffer) {}

    uint8_t readUInt8();
    uint32_t readUInt32();
    uint64_t readUInt64();
    std::string readBytes();
    std::string readRaw(size_t length);

    [[nodiscard]] size_t getPosition() const { return position; }

    [[nodiscard]] size_t remaining() const { return buffer.size() - position; }

  private:
    void require(size_t length) const;

    std::string_view buffer;
    size_t position = 0;
};

/**
 * @brief 64 bit FNV-1a hash used to detect corrupted spill records.
 * @param bytes the input
 * @return checksum
 */
uint64_t fnv1a(std::string_view bytes);

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_BYTECODEC_HPP_
