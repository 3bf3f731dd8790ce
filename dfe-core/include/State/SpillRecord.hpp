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

#ifndef DFE_CORE_INCLUDE_STATE_SPILLRECORD_HPP_
#define DFE_CORE_INCLUDE_STATE_SPILLRECORD_HPP_

#include <Windowing/Window.hpp>
#include <cstdint>
#include <string>

namespace DFE::State {

/**
 * @brief Binary frame of a spilled state entry.
 * Layout: magic "DFES" | version (uint8) | window start (uint64) | window end (uint64) |
 * key length (uint32) | key bytes | value length (uint32) | value bytes | FNV-1a checksum of all previous bytes (uint64).
 * All integers are little endian.
 */
class SpillRecord {
  public:
    static constexpr uint8_t VERSION = 1;

    SpillRecord(std::string keyBytes, Windowing::Window window, std::string valueBytes);

    /**
     * @brief Encodes the record into its binary frame.
     * @return the frame
     */
    [[nodiscard]] std::string encode() const;

    /**
     * @brief Decodes a binary frame.
     * @param bytes the frame
     * @return the record
     * @throws StateCorruptionException if the magic, version, length or checksum does not match
     */
    static SpillRecord decode(const std::string& bytes);

    [[nodiscard]] const std::string& getKeyBytes() const { return keyBytes; }

    [[nodiscard]] const Windowing::Window& getWindow() const { return window; }

    [[nodiscard]] const std::string& getValueBytes() const { return valueBytes; }

  private:
    std::string keyBytes;
    Windowing::Window window;
    std::string valueBytes;
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_SPILLRECORD_HPP_
