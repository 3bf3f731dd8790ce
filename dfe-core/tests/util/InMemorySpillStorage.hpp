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

#ifndef DFE_CORE_TESTS_UTIL_INMEMORYSPILLSTORAGE_HPP_
#define DFE_CORE_TESTS_UTIL_INMEMORYSPILLSTORAGE_HPP_

#include <Exceptions/SpillIOException.hpp>
#include <State/SpillStorage.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace DFE::Testing {

/**
 * @brief Spill storage that keeps records in a map.
 * Tests can tamper with records and make writes fail.
 */
class InMemorySpillStorage : public State::SpillStorage {
  public:
    static std::shared_ptr<InMemorySpillStorage> create() { return std::make_shared<InMemorySpillStorage>(); }

    void write(const std::string& recordId, const std::string& bytes) override {
        if (failWrites) {
            throw Exceptions::SpillIOException("cannot write record " + recordId);
        }
        records[recordId] = bytes;
        ++numberOfWrites;
    }

    std::string read(const std::string& recordId) override {
        auto it = records.find(recordId);
        if (it == records.end()) {
            throw Exceptions::SpillIOException("record " + recordId + " does not exist");
        }
        return it->second;
    }

    void remove(const std::string& recordId) override {
        if (records.erase(recordId) == 0) {
            throw Exceptions::SpillIOException("record " + recordId + " does not exist");
        }
    }

    [[nodiscard]] std::vector<std::string> getRecordIds() const {
        std::vector<std::string> ids;
        for (const auto& record : records) {
            ids.emplace_back(record.first);
        }
        return ids;
    }

    void overwrite(const std::string& recordId, const std::string& bytes) { records[recordId] = bytes; }

    [[nodiscard]] uint64_t getNumberOfRecords() const { return records.size(); }
    [[nodiscard]] uint64_t getNumberOfWrites() const { return numberOfWrites; }

    bool failWrites = false;

  private:
    std::map<std::string, std::string> records;
    uint64_t numberOfWrites = 0;
};

/**
 * @brief Hands out in-memory storages, optionally failing ones.
 */
class InMemorySpillStorageFactory : public State::SpillStorageFactory {
  public:
    explicit InMemorySpillStorageFactory(bool failWrites = false) : failWrites(failWrites) {}

    static std::shared_ptr<InMemorySpillStorageFactory> create(bool failWrites) {
        return std::make_shared<InMemorySpillStorageFactory>(failWrites);
    }

    State::SpillStoragePtr create() override {
        auto storage = InMemorySpillStorage::create();
        storage->failWrites = failWrites;
        storages.emplace_back(storage);
        return storage;
    }

    [[nodiscard]] const std::vector<std::shared_ptr<InMemorySpillStorage>>& getStorages() const { return storages; }

  private:
    const bool failWrites;
    std::vector<std::shared_ptr<InMemorySpillStorage>> storages;
};

}// namespace DFE::Testing

#endif// DFE_CORE_TESTS_UTIL_INMEMORYSPILLSTORAGE_HPP_
