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

#ifndef DFE_CORE_INCLUDE_STATE_KEYEDWINDOWSTATESTORE_HPP_
#define DFE_CORE_INCLUDE_STATE_KEYEDWINDOWSTATESTORE_HPP_

#include <State/SpillStorage.hpp>
#include <State/StateDescriptor.hpp>
#include <State/StateKey.hpp>
#include <Windowing/Window.hpp>
#include <any>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace DFE::State {

class KeyedWindowStateStore;
using KeyedWindowStateStorePtr = std::shared_ptr<KeyedWindowStateStore>;

/**
 * @brief Keeps one accumulator per (key, window) and bounds the number of accumulators held in memory.
 * If more than capacity entries would be in memory, the least recently touched entry is written to the spill
 * storage as a SpillRecord. Accessing a spilled entry loads it back and spills another one in exchange.
 * Every (key, window) exists exactly once, either in memory or spilled.
 * The store is not thread-safe, it has to be confined to the partition that owns its keys.
 */
class KeyedWindowStateStore {
  public:
    using AccumulatorVisitor = std::function<void(const std::any& key, std::any& accumulator)>;

    /**
     * @brief Creates a state store.
     * @param descriptor describes the keys and accumulators
     * @param capacity maximal number of entries in memory, at least 1
     * @param spillStorage receives entries that do not fit into memory
     */
    KeyedWindowStateStore(StateDescriptor descriptor, uint64_t capacity, SpillStoragePtr spillStorage);

    static KeyedWindowStateStorePtr create(StateDescriptor descriptor, uint64_t capacity, SpillStoragePtr spillStorage);

    /**
     * @brief Returns the accumulator of (key, window) and creates it if it does not exist.
     * The reference is valid until the next call that modifies the store.
     * @param key the key
     * @param window the window
     * @return accumulator
     * @throws StateCorruptionException if a spilled entry cannot be restored, the entry is dropped
     * @throws SpillIOException if the spill storage fails
     */
    std::any& getOrCreate(const std::any& key, const Windowing::Window& window);

    /**
     * @brief Replaces the accumulator of (key, window).
     */
    void put(const std::any& key, const Windowing::Window& window, std::any accumulator);

    [[nodiscard]] bool contains(const std::any& key, const Windowing::Window& window) const;

    /**
     * @brief Removes the entry of (key, window).
     * @return true if the entry existed
     */
    bool remove(const std::any& key, const Windowing::Window& window);

    /**
     * @brief Removes all entries of a key.
     */
    void removeKey(const std::any& key);

    /**
     * @brief Calls visitor for every entry of a window, spilled entries are loaded first.
     * @param window the window
     * @param visitor receives the key and the accumulator
     */
    void forEachInWindow(const Windowing::Window& window, const AccumulatorVisitor& visitor);

    /**
     * @brief Moves every entry of source into the entry of the same key in target.
     * If the key already has an entry in target, both accumulators are combined.
     * A corrupted target entry is replaced by the source entry before the StateCorruptionException is rethrown.
     * @param source window that is merged away
     * @param target window that receives the state
     */
    void relocate(const Windowing::Window& source, const Windowing::Window& target);

    /**
     * @brief Moves the entry of (key, source) into (key, target), see relocate(source, target).
     */
    void relocate(const std::any& key, const Windowing::Window& source, const Windowing::Window& target);

    /**
     * @brief Returns all windows that hold at least one entry in ascending order.
     */
    [[nodiscard]] std::vector<Windowing::Window> getWindows() const;

    /**
     * @brief Returns the windows of a key in ascending order.
     */
    [[nodiscard]] std::vector<Windowing::Window> getWindowsOfKey(const std::any& key) const;

    [[nodiscard]] uint64_t getNumberOfEntries() const { return entries.size(); }

    [[nodiscard]] uint64_t getNumberOfInMemoryEntries() const { return lruList.size(); }

    [[nodiscard]] uint64_t getNumberOfSpilledEntries() const { return entries.size() - lruList.size(); }

    [[nodiscard]] uint64_t getCapacity() const { return capacity; }

  private:
    struct InMemoryEntry {
        std::any key;
        std::any accumulator;
        uint64_t lastTouched;
        std::list<StateKey>::iterator lruPosition;
    };

    struct SpilledEntry {
        std::string recordId;
    };

    using Entry = std::variant<InMemoryEntry, SpilledEntry>;

    [[nodiscard]] std::string encodeKey(const std::any& key) const;
    InMemoryEntry& insert(const StateKey& stateKey, std::any key, std::any accumulator);
    InMemoryEntry& load(const StateKey& stateKey);
    void touch(InMemoryEntry& entry);
    void evictIfFull();
    void spill(StateKey stateKey);
    bool erase(const StateKey& stateKey);
    void relocateEntry(const std::string& keyBytes, const Windowing::Window& source, const Windowing::Window& target);
    void index(const StateKey& stateKey);
    void unindex(const StateKey& stateKey);

    StateDescriptor descriptor;
    const uint64_t capacity;
    SpillStoragePtr spillStorage;
    std::unordered_map<StateKey, Entry, StateKeyHash> entries;
    // in-memory entries, most recently touched first
    std::list<StateKey> lruList;
    std::map<Windowing::Window, std::set<std::string>> windowIndex;
    std::unordered_map<std::string, std::set<Windowing::Window>> keyIndex;
    uint64_t logicalClock = 0;
    uint64_t nextRecordSequence = 0;
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_KEYEDWINDOWSTATESTORE_HPP_
