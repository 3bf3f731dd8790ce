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

#ifndef DFE_CORE_INCLUDE_STATE_SPILLSTORAGE_HPP_
#define DFE_CORE_INCLUDE_STATE_SPILLSTORAGE_HPP_

#include <memory>
#include <string>

namespace DFE::State {

class SpillStorage;
using SpillStoragePtr = std::shared_ptr<SpillStorage>;

/**
 * @brief Byte store that receives state entries which do not fit into memory.
 * Records are addressed by opaque ids chosen by the caller.
 * All operations throw a SpillIOException on failure.
 */
class SpillStorage {
  public:
    virtual ~SpillStorage() = default;

    /**
     * @brief Stores bytes under recordId, replacing an existing record.
     */
    virtual void write(const std::string& recordId, const std::string& bytes) = 0;

    /**
     * @brief Returns the bytes stored under recordId.
     */
    virtual std::string read(const std::string& recordId) = 0;

    /**
     * @brief Deletes the record with recordId.
     */
    virtual void remove(const std::string& recordId) = 0;
};

class SpillStorageFactory;
using SpillStorageFactoryPtr = std::shared_ptr<SpillStorageFactory>;

/**
 * @brief Creates one spill storage per state store.
 */
class SpillStorageFactory {
  public:
    virtual ~SpillStorageFactory() = default;

    virtual SpillStoragePtr create() = 0;
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_SPILLSTORAGE_HPP_
