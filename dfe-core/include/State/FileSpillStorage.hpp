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

#ifndef DFE_CORE_INCLUDE_STATE_FILESPILLSTORAGE_HPP_
#define DFE_CORE_INCLUDE_STATE_FILESPILLSTORAGE_HPP_

#include <State/SpillStorage.hpp>
#include <filesystem>

namespace DFE::State {

/**
 * @brief Spill storage that keeps every record in its own file below a private directory.
 * The directory and all remaining records are deleted when the storage is destroyed.
 */
class FileSpillStorage : public SpillStorage {
  public:
    explicit FileSpillStorage(std::filesystem::path directory);

    ~FileSpillStorage() override;

    FileSpillStorage(const FileSpillStorage&) = delete;
    FileSpillStorage& operator=(const FileSpillStorage&) = delete;

    void write(const std::string& recordId, const std::string& bytes) override;

    std::string read(const std::string& recordId) override;

    void remove(const std::string& recordId) override;

    [[nodiscard]] const std::filesystem::path& getDirectory() const { return directory; }

  private:
    [[nodiscard]] std::filesystem::path pathOf(const std::string& recordId) const;

    std::filesystem::path directory;
};

/**
 * @brief Creates FileSpillStorages in unique sub directories of a base directory.
 */
class FileSpillStorageFactory : public SpillStorageFactory {
  public:
    explicit FileSpillStorageFactory(std::filesystem::path baseDirectory);

    static SpillStorageFactoryPtr create(const std::filesystem::path& baseDirectory);

    SpillStoragePtr create() override;

  private:
    std::filesystem::path baseDirectory;
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_FILESPILLSTORAGE_HPP_
