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
#include <State/KeyedWindowStateStore.hpp>
#include <State/SpillRecord.hpp>
#include <Util/Logger/Logger.hpp>
#include <fmt/format.h>

namespace DFE::State {

KeyedWindowStateStore::KeyedWindowStateStore(StateDescriptor descriptor, uint64_t capacity, SpillStoragePtr spillStorage)
    : descriptor(std::move(descriptor)), capacity(capacity), spillStorage(std::move(spillStorage)) {
    DFE_ASSERT(this->capacity > 0, "the state store needs room for at least one entry");
    DFE_ASSERT(this->spillStorage, "the state store requires a spill storage");
    DFE_ASSERT(this->descriptor.keySerde && this->descriptor.accumulatorSerde, "the state descriptor requires serdes");
    DFE_ASSERT(this->descriptor.createAccumulator && this->descriptor.combine,
               "the state descriptor requires accumulator functions");
}

KeyedWindowStateStorePtr
KeyedWindowStateStore::create(StateDescriptor descriptor, uint64_t capacity, SpillStoragePtr spillStorage) {
    return std::make_shared<KeyedWindowStateStore>(std::move(descriptor), capacity, std::move(spillStorage));
}

std::string KeyedWindowStateStore::encodeKey(const std::any& key) const { return descriptor.keySerde->serialize(key); }

std::any& KeyedWindowStateStore::getOrCreate(const std::any& key, const Windowing::Window& window) {
    StateKey stateKey{encodeKey(key), window};
    if (!entries.contains(stateKey)) {
        return insert(stateKey, key, descriptor.createAccumulator()).accumulator;
    }
    return load(stateKey).accumulator;
}

void KeyedWindowStateStore::put(const std::any& key, const Windowing::Window& window, std::any accumulator) {
    StateKey stateKey{encodeKey(key), window};
    if (!entries.contains(stateKey)) {
        insert(stateKey, key, std::move(accumulator));
        return;
    }
    load(stateKey).accumulator = std::move(accumulator);
}

bool KeyedWindowStateStore::contains(const std::any& key, const Windowing::Window& window) const {
    return entries.contains(StateKey{encodeKey(key), window});
}

bool KeyedWindowStateStore::remove(const std::any& key, const Windowing::Window& window) {
    return erase(StateKey{encodeKey(key), window});
}

void KeyedWindowStateStore::removeKey(const std::any& key) {
    auto keyBytes = encodeKey(key);
    auto it = keyIndex.find(keyBytes);
    if (it == keyIndex.end()) {
        return;
    }
    auto windows = it->second;
    for (const auto& window : windows) {
        erase(StateKey{keyBytes, window});
    }
}

void KeyedWindowStateStore::forEachInWindow(const Windowing::Window& window, const AccumulatorVisitor& visitor) {
    auto it = windowIndex.find(window);
    if (it == windowIndex.end()) {
        return;
    }
    // the visitor may trigger spills that change the index, so we iterate over a snapshot
    auto keys = it->second;
    for (const auto& keyBytes : keys) {
        StateKey stateKey{keyBytes, window};
        if (!entries.contains(stateKey)) {
            continue;
        }
        auto& entry = load(stateKey);
        visitor(entry.key, entry.accumulator);
    }
}

void KeyedWindowStateStore::relocate(const Windowing::Window& source, const Windowing::Window& target) {
    if (source == target) {
        return;
    }
    auto it = windowIndex.find(source);
    if (it == windowIndex.end()) {
        return;
    }
    auto keys = it->second;
    DFE_DEBUG2("KeyedWindowStateStore: relocate {} entries from {} to {}", keys.size(), source.toString(), target.toString());
    for (const auto& keyBytes : keys) {
        relocateEntry(keyBytes, source, target);
    }
}

void KeyedWindowStateStore::relocate(const std::any& key, const Windowing::Window& source, const Windowing::Window& target) {
    relocateEntry(encodeKey(key), source, target);
}

void KeyedWindowStateStore::relocateEntry(const std::string& keyBytes,
                                          const Windowing::Window& source,
                                          const Windowing::Window& target) {
    if (source == target) {
        return;
    }
    StateKey sourceKey{keyBytes, source};
    if (!entries.contains(sourceKey)) {
        return;
    }
    auto& sourceEntry = load(sourceKey);
    auto key = sourceEntry.key;
    auto accumulator = std::move(sourceEntry.accumulator);
    erase(sourceKey);

    StateKey targetKey{keyBytes, target};
    if (!entries.contains(targetKey)) {
        insert(targetKey, std::move(key), std::move(accumulator));
        return;
    }
    try {
        auto& targetEntry = load(targetKey);
        targetEntry.accumulator = descriptor.combine(targetEntry.accumulator, accumulator);
    } catch (const Exceptions::StateCorruptionException&) {
        // load dropped the corrupted target, the relocated state becomes the new target entry
        insert(targetKey, std::move(key), std::move(accumulator));
        throw;
    }
}

std::vector<Windowing::Window> KeyedWindowStateStore::getWindows() const {
    std::vector<Windowing::Window> windows;
    windows.reserve(windowIndex.size());
    for (const auto& [window, keys] : windowIndex) {
        windows.emplace_back(window);
    }
    return windows;
}

std::vector<Windowing::Window> KeyedWindowStateStore::getWindowsOfKey(const std::any& key) const {
    auto it = keyIndex.find(encodeKey(key));
    if (it == keyIndex.end()) {
        return {};
    }
    return std::vector<Windowing::Window>(it->second.begin(), it->second.end());
}

KeyedWindowStateStore::InMemoryEntry&
KeyedWindowStateStore::insert(const StateKey& stateKey, std::any key, std::any accumulator) {
    evictIfFull();
    lruList.push_front(stateKey);
    auto [it, inserted] =
        entries.emplace(stateKey, InMemoryEntry{std::move(key), std::move(accumulator), ++logicalClock, lruList.begin()});
    DFE_ASSERT(inserted, "state entry of window " << stateKey.window << " exists already");
    index(stateKey);
    return std::get<InMemoryEntry>(it->second);
}

KeyedWindowStateStore::InMemoryEntry& KeyedWindowStateStore::load(const StateKey& stateKey) {
    auto& entry = entries.at(stateKey);
    if (auto* inMemory = std::get_if<InMemoryEntry>(&entry)) {
        touch(*inMemory);
        return *inMemory;
    }

    auto recordId = std::get<SpilledEntry>(entry).recordId;
    auto bytes = spillStorage->read(recordId);
    std::any key;
    std::any accumulator;
    try {
        auto record = SpillRecord::decode(bytes);
        if (record.getKeyBytes() != stateKey.keyBytes || record.getWindow() != stateKey.window) {
            throw Exceptions::StateCorruptionException("spill record " + recordId + " belongs to window "
                                                       + record.getWindow().toString());
        }
        key = descriptor.keySerde->deserialize(record.getKeyBytes());
        accumulator = descriptor.accumulatorSerde->deserialize(record.getValueBytes());
    } catch (const Exceptions::StateCorruptionException& e) {
        DFE_WARNING2("KeyedWindowStateStore: drop spilled entry {} of window {}", recordId, stateKey.window.toString());
        erase(stateKey);
        throw Exceptions::StateCorruptionException("state of window " + stateKey.window.toString()
                                                   + " cannot be restored from " + recordId + ": " + e.what());
    }

    evictIfFull();
    spillStorage->remove(recordId);
    lruList.push_front(stateKey);
    entry = InMemoryEntry{std::move(key), std::move(accumulator), ++logicalClock, lruList.begin()};
    DFE_TRACE2("KeyedWindowStateStore: loaded {} of window {}", recordId, stateKey.window.toString());
    return std::get<InMemoryEntry>(entry);
}

void KeyedWindowStateStore::touch(InMemoryEntry& entry) {
    lruList.splice(lruList.begin(), lruList, entry.lruPosition);
    entry.lastTouched = ++logicalClock;
}

void KeyedWindowStateStore::evictIfFull() {
    while (lruList.size() >= capacity) {
        spill(lruList.back());
    }
}

void KeyedWindowStateStore::spill(StateKey stateKey) {
    auto& entry = entries.at(stateKey);
    auto& inMemory = std::get<InMemoryEntry>(entry);
    auto recordId = fmt::format("{}-{}-{}", stateKey.window.getStart(), stateKey.window.getEnd(), nextRecordSequence++);
    SpillRecord record(stateKey.keyBytes, stateKey.window, descriptor.accumulatorSerde->serialize(inMemory.accumulator));
    spillStorage->write(recordId, record.encode());
    lruList.erase(inMemory.lruPosition);
    DFE_TRACE2("KeyedWindowStateStore: spilled entry of window {} last touched at {} to {}",
               stateKey.window.toString(),
               inMemory.lastTouched,
               recordId);
    entry = SpilledEntry{recordId};
}

bool KeyedWindowStateStore::erase(const StateKey& stateKey) {
    auto it = entries.find(stateKey);
    if (it == entries.end()) {
        return false;
    }
    if (auto* spilled = std::get_if<SpilledEntry>(&it->second)) {
        spillStorage->remove(spilled->recordId);
    } else {
        lruList.erase(std::get<InMemoryEntry>(it->second).lruPosition);
    }
    entries.erase(it);
    unindex(stateKey);
    return true;
}

void KeyedWindowStateStore::index(const StateKey& stateKey) {
    windowIndex[stateKey.window].insert(stateKey.keyBytes);
    keyIndex[stateKey.keyBytes].insert(stateKey.window);
}

void KeyedWindowStateStore::unindex(const StateKey& stateKey) {
    if (auto it = windowIndex.find(stateKey.window); it != windowIndex.end()) {
        it->second.erase(stateKey.keyBytes);
        if (it->second.empty()) {
            windowIndex.erase(it);
        }
    }
    if (auto it = keyIndex.find(stateKey.keyBytes); it != keyIndex.end()) {
        it->second.erase(stateKey.window);
        if (it->second.empty()) {
            keyIndex.erase(it);
        }
    }
}

}// namespace DFE::State
