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

#include <DfeBaseTest.hpp>
#include <Exceptions/SpillIOException.hpp>
#include <Exceptions/StateCorruptionException.hpp>
#include <InMemorySpillStorage.hpp>
#include <State/KeyedWindowStateStore.hpp>
#include <State/SpillRecord.hpp>
#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>

namespace DFE::State {

using Windowing::Window;

class KeyedWindowStateStoreTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("KeyedWindowStateStoreTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup KeyedWindowStateStoreTest test class.");
    }

    void SetUp() override {
        Testing::DfeBaseTest::SetUp();
        storage = Testing::InMemorySpillStorage::create();
    }

    KeyedWindowStateStorePtr createStore(uint64_t capacity) {
        StateDescriptor descriptor{StringSerde::create(),
                                   Int64Serde::create(),
                                   []() {
                                       return std::any(int64_t{0});
                                   },
                                   [](const std::any& left, const std::any& right) {
                                       return std::any(std::any_cast<int64_t>(left) + std::any_cast<int64_t>(right));
                                   }};
        return KeyedWindowStateStore::create(descriptor, capacity, storage);
    }

    static int64_t valueOf(const KeyedWindowStateStorePtr& store, const std::string& key, const Window& window) {
        return std::any_cast<int64_t>(store->getOrCreate(key, window));
    }

    std::shared_ptr<Testing::InMemorySpillStorage> storage;
};

TEST_F(KeyedWindowStateStoreTest, overflowSpillsExactlyOneEntry) {
    auto store = createStore(3);
    Window window(0, 100);
    for (int64_t i = 0; i < 4; ++i) {
        store->put(std::string("key") + std::to_string(i), window, i * 10);
    }
    EXPECT_EQ(store->getNumberOfEntries(), 4u);
    EXPECT_EQ(store->getNumberOfInMemoryEntries(), 3u);
    EXPECT_EQ(store->getNumberOfSpilledEntries(), 1u);
    EXPECT_EQ(storage->getNumberOfRecords(), 1u);

    // the least recently used entry was spilled and comes back unchanged
    EXPECT_EQ(valueOf(store, "key0", window), 0);
    EXPECT_EQ(store->getNumberOfSpilledEntries(), 1u);
    for (int64_t i = 0; i < 4; ++i) {
        EXPECT_EQ(valueOf(store, "key" + std::to_string(i), window), i * 10);
    }
    EXPECT_LE(store->getNumberOfInMemoryEntries(), store->getCapacity());
}

TEST_F(KeyedWindowStateStoreTest, touchedEntriesStayInMemory) {
    auto store = createStore(3);
    Window window(0, 100);
    store->put(std::string("a"), window, int64_t{1});
    store->put(std::string("b"), window, int64_t{2});
    store->put(std::string("c"), window, int64_t{3});
    store->getOrCreate(std::string("a"), window);
    store->put(std::string("d"), window, int64_t{4});
    ASSERT_EQ(storage->getNumberOfWrites(), 1u);

    // "a" was touched before the overflow, so "b" is the one on disk
    EXPECT_EQ(valueOf(store, "a", window), 1);
    EXPECT_EQ(storage->getNumberOfWrites(), 1u);
    EXPECT_EQ(valueOf(store, "b", window), 2);
    EXPECT_EQ(storage->getNumberOfWrites(), 2u);
}

TEST_F(KeyedWindowStateStoreTest, relocateMovesAndCombinesEntries) {
    auto store = createStore(10);
    Window source(0, 100);
    Window target(0, 150);
    store->put(std::string("a"), source, int64_t{1});
    store->put(std::string("a"), target, int64_t{2});
    store->put(std::string("b"), source, int64_t{5});

    store->relocate(source, target);
    EXPECT_FALSE(store->contains(std::string("a"), source));
    EXPECT_FALSE(store->contains(std::string("b"), source));
    EXPECT_EQ(valueOf(store, "a", target), 3);
    EXPECT_EQ(valueOf(store, "b", target), 5);
    EXPECT_EQ(store->getWindows(), std::vector<Window>{target});
}

TEST_F(KeyedWindowStateStoreTest, relocateSingleKeyLeavesOtherKeys) {
    auto store = createStore(1);
    Window source(0, 100);
    Window target(0, 150);
    store->put(std::string("a"), source, int64_t{1});
    store->put(std::string("b"), source, int64_t{5});

    store->relocate(std::string("a"), source, target);
    EXPECT_EQ(store->getWindowsOfKey(std::string("a")), std::vector<Window>{target});
    EXPECT_EQ(valueOf(store, "a", target), 1);
    EXPECT_EQ(valueOf(store, "b", source), 5);
}

TEST_F(KeyedWindowStateStoreTest, removeAndVisit) {
    auto store = createStore(2);
    Window first(0, 100);
    Window second(100, 200);
    store->put(std::string("a"), first, int64_t{1});
    store->put(std::string("b"), first, int64_t{2});
    store->put(std::string("a"), second, int64_t{3});

    int64_t sum = 0;
    store->forEachInWindow(first, [&sum](const std::any&, std::any& accumulator) {
        sum += std::any_cast<int64_t>(accumulator);
    });
    EXPECT_EQ(sum, 3);

    EXPECT_TRUE(store->remove(std::string("b"), first));
    EXPECT_FALSE(store->remove(std::string("b"), first));
    store->removeKey(std::string("a"));
    EXPECT_EQ(store->getNumberOfEntries(), 0u);
    EXPECT_TRUE(store->getWindows().empty());
    EXPECT_EQ(storage->getNumberOfRecords(), 0u);
}

TEST_F(KeyedWindowStateStoreTest, foreignSpillRecordIsDetected) {
    auto store = createStore(1);
    Window window(0, 100);
    store->put(std::string("a"), window, int64_t{1});
    store->put(std::string("b"), window, int64_t{2});
    ASSERT_EQ(storage->getNumberOfRecords(), 1u);

    auto recordId = storage->getRecordIds().front();
    storage->overwrite(recordId, SpillRecord("a", Window(500, 600), Int64Serde::create()->serialize(int64_t{9})).encode());
    EXPECT_THROW(store->getOrCreate(std::string("a"), window), Exceptions::StateCorruptionException);

    // the corrupted entry is gone, the other entry is untouched
    EXPECT_FALSE(store->contains(std::string("a"), window));
    EXPECT_EQ(valueOf(store, "b", window), 2);
}

TEST_F(KeyedWindowStateStoreTest, relocateOntoCorruptedTargetKeepsTheSourceState) {
    auto store = createStore(1);
    store->put(std::string("a"), Window(0, 100), int64_t{5});
    // the second entry spills the first one
    store->put(std::string("a"), Window(50, 150), int64_t{7});
    ASSERT_EQ(storage->getNumberOfRecords(), 1u);
    storage->overwrite(storage->getRecordIds().front(), "garbage");

    EXPECT_THROW(store->relocate(std::string("a"), Window(50, 150), Window(0, 100)), Exceptions::StateCorruptionException);
    EXPECT_FALSE(store->contains(std::string("a"), Window(50, 150)));
    ASSERT_TRUE(store->contains(std::string("a"), Window(0, 100)));
    EXPECT_EQ(store->getNumberOfEntries(), 1u);
    EXPECT_EQ(valueOf(store, "a", Window(0, 100)), 7);
    EXPECT_EQ(storage->getNumberOfRecords(), 0u);
}

TEST_F(KeyedWindowStateStoreTest, failingSpillStorageRaisesSpillIO) {
    storage->failWrites = true;
    auto store = createStore(1);
    Window window(0, 100);
    store->put(std::string("a"), window, int64_t{1});
    EXPECT_THROW(store->put(std::string("b"), window, int64_t{2}), Exceptions::SpillIOException);
}

TEST_F(KeyedWindowStateStoreTest, zeroCapacityIsRejected) {
    EXPECT_THROW(createStore(0), Exceptions::RuntimeException);
}

}// namespace DFE::State
