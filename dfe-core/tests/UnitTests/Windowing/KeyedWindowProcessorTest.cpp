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
#include <Exceptions/ProcessingFailure.hpp>
#include <InMemorySpillStorage.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/Runtime/KeyedWindowProcessor.hpp>
#include <Windowing/Watermark/WatermarkGenerator.hpp>
#include <Windowing/WindowTypes/SessionWindowing.hpp>
#include <Windowing/WindowTypes/SlidingWindowing.hpp>
#include <Windowing/WindowTypes/TumblingWindowing.hpp>
#include <gtest/gtest.h>
#include <map>

namespace DFE::Windowing {

namespace {

// an element that carries its own window, used to drive merges precisely
struct WindowedEvent {
    std::string key;
    uint64_t start;
    uint64_t end;
    int64_t value;
};

class EventWindowing : public WindowingStrategy {
  public:
    [[nodiscard]] std::vector<Window> assignWindows(const WindowedElement& element) const override {
        const auto& event = std::any_cast<const WindowedEvent&>(element.getValue());
        return {Window(event.start, event.end)};
    }
    [[nodiscard]] bool isMerging() const override { return true; }
    [[nodiscard]] std::vector<MergeSet> mergeWindows(const std::vector<Window>& windows) const override {
        return SessionWindowing::of(1)->mergeWindows(windows);
    }
    [[nodiscard]] std::string toString() const override { return "EventWindowing"; }
};

// merges every window starting at 1000 or later with a window that was never assigned
class InconsistentWindowing : public WindowingStrategy {
  public:
    [[nodiscard]] std::vector<Window> assignWindows(const WindowedElement& element) const override {
        auto start = element.getTimestamp() - element.getTimestamp() % 100;
        return {Window(start, start + 100)};
    }
    [[nodiscard]] bool isMerging() const override { return true; }
    [[nodiscard]] std::vector<MergeSet> mergeWindows(const std::vector<Window>& windows) const override {
        std::vector<MergeSet> merges;
        for (const auto& window : windows) {
            if (window.getStart() >= 1000) {
                merges.emplace_back(std::vector<Window>{window, Window(5000, 5001)}, Window(window.getStart(), 5001));
            }
        }
        return merges;
    }
    [[nodiscard]] std::string toString() const override { return "InconsistentWindowing"; }
};

AccumulatorFunctions sumFunctions() {
    AccumulatorFunctions functions;
    functions.create = []() {
        return std::any(int64_t{0});
    };
    functions.add = [](const std::any& accumulator, const std::any& value) {
        return std::any(std::any_cast<int64_t>(accumulator) + std::any_cast<int64_t>(value));
    };
    functions.combine = [](const std::any& left, const std::any& right) {
        return std::any(std::any_cast<int64_t>(left) + std::any_cast<int64_t>(right));
    };
    functions.flush = [](const std::any&, const std::any& accumulator, Collector& collector) {
        collector.collect(accumulator);
    };
    return functions;
}

std::any keyOf(const std::any& value) {
    if (const auto* event = std::any_cast<WindowedEvent>(&value)) {
        return event->key;
    }
    return std::any_cast<const KeyValue&>(value).first;
}

std::any valueOf(const std::any& value) {
    if (const auto* event = std::any_cast<WindowedEvent>(&value)) {
        return event->value;
    }
    return std::any_cast<const KeyValue&>(value).second;
}

WindowedElement element(const std::string& key, int64_t value, uint64_t timestamp) {
    return {KeyValue(key, value), timestamp};
}

WindowedElement event(const std::string& key, uint64_t start, uint64_t end, int64_t value) {
    return {WindowedEvent{key, start, end, value}, start};
}

// flattens the output of a watermark into key -> sum for every fired window
std::map<std::pair<Window, std::string>, int64_t> results(const std::vector<WindowedElement>& output) {
    std::map<std::pair<Window, std::string>, int64_t> sums;
    for (const auto& out : output) {
        EXPECT_EQ(out.getWindows().size(), 1u);
        const auto& kv = std::any_cast<const KeyValue&>(out.getValue());
        sums[{out.getWindows().front(), std::any_cast<std::string>(kv.first)}] = std::any_cast<int64_t>(kv.second);
    }
    return sums;
}

}// namespace

class KeyedWindowProcessorTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("KeyedWindowProcessorTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup KeyedWindowProcessorTest test class.");
    }

    void SetUp() override {
        Testing::DfeBaseTest::SetUp();
        storage = Testing::InMemorySpillStorage::create();
        failures.clear();
    }

    std::shared_ptr<KeyedWindowProcessor> createProcessor(WindowingStrategyPtr windowing, uint64_t capacity = 100) {
        auto functions = sumFunctions();
        State::StateDescriptor descriptor{State::StringSerde::create(),
                                          State::Int64Serde::create(),
                                          functions.create,
                                          functions.combine};
        store = State::KeyedWindowStateStore::create(descriptor, capacity, storage);
        return std::make_shared<KeyedWindowProcessor>("sum",
                                                      std::move(windowing),
                                                      keyOf,
                                                      valueOf,
                                                      functions,
                                                      State::StringSerde::create(),
                                                      store,
                                                      [this](const Exceptions::ProcessingFailure& failure) {
                                                          failures.emplace_back(failure);
                                                      });
    }

    std::shared_ptr<Testing::InMemorySpillStorage> storage;
    State::KeyedWindowStateStorePtr store;
    std::vector<Exceptions::ProcessingFailure> failures;
};

TEST_F(KeyedWindowProcessorTest, tumblingWindowFiresPerKeyResults) {
    auto processor = createProcessor(TumblingWindowing::of(1000));
    processor->onElement(element("a", 1, 1000));
    processor->onElement(element("b", 2, 1500));
    processor->onElement(element("a", 3, 1800));

    EXPECT_TRUE(processor->onWatermark(1999).empty());
    auto output = processor->onWatermark(2001);
    ASSERT_EQ(output.size(), 2u);
    // keys of one window fire in key order
    EXPECT_EQ(std::any_cast<std::string>(std::any_cast<const KeyValue&>(output[0].getValue()).first), "a");
    EXPECT_EQ(output[0].getTimestamp(), 1999u);

    auto sums = results(output);
    EXPECT_EQ((sums[{Window(1000, 2000), "a"}]), 4);
    EXPECT_EQ((sums[{Window(1000, 2000), "b"}]), 2);
    EXPECT_EQ(store->getNumberOfEntries(), 0u);
    EXPECT_TRUE(failures.empty());
}

TEST_F(KeyedWindowProcessorTest, sessionWindowsAreMergedBeforeTheNextFold) {
    auto processor = createProcessor(std::make_shared<EventWindowing>());
    processor->onElement(event("a", 0, 100, 1));
    EXPECT_EQ(processor->getTrackedWindows(std::string("a")), std::vector<Window>{Window(0, 100)});

    processor->onElement(event("a", 80, 150, 2));
    EXPECT_EQ(processor->getTrackedWindows(std::string("a")), std::vector<Window>{Window(0, 150)});
    EXPECT_FALSE(store->contains(std::string("a"), Window(0, 100)));
    EXPECT_FALSE(store->contains(std::string("a"), Window(80, 150)));
    EXPECT_EQ(std::any_cast<int64_t>(store->getOrCreate(std::string("a"), Window(0, 150))), 3);

    processor->onElement(event("a", 90, 140, 4));
    EXPECT_EQ(processor->getTrackedWindows(std::string("a")), std::vector<Window>{Window(0, 150)});

    auto sums = results(processor->onWatermark(WatermarkGenerator::FINAL_WATERMARK));
    ASSERT_EQ(sums.size(), 1u);
    EXPECT_EQ((sums[{Window(0, 150), "a"}]), 7);
}

TEST_F(KeyedWindowProcessorTest, sessionMergesDoNotAffectOtherKeys) {
    auto processor = createProcessor(SessionWindowing::of(100));
    processor->onElement(element("a", 1, 0));
    processor->onElement(element("b", 10, 50));
    processor->onElement(element("a", 2, 50));
    processor->onElement(element("a", 4, 400));

    EXPECT_EQ(processor->getTrackedWindows(std::string("a")), (std::vector<Window>{Window(0, 150), Window(400, 500)}));
    EXPECT_EQ(processor->getTrackedWindows(std::string("b")), std::vector<Window>{Window(50, 150)});

    auto sums = results(processor->onWatermark(WatermarkGenerator::FINAL_WATERMARK));
    ASSERT_EQ(sums.size(), 3u);
    EXPECT_EQ((sums[{Window(0, 150), "a"}]), 3);
    EXPECT_EQ((sums[{Window(400, 500), "a"}]), 4);
    EXPECT_EQ((sums[{Window(50, 150), "b"}]), 10);
}

TEST_F(KeyedWindowProcessorTest, inconsistentMergeAbandonsOnlyTheAffectedKey) {
    auto processor = createProcessor(std::make_shared<InconsistentWindowing>());
    processor->onElement(element("bad", 5, 10));
    processor->onElement(element("good", 1, 10));
    processor->onElement(element("bad", 7, 1000));

    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].kind, Exceptions::FailureKind::MERGE_CONSISTENCY);
    EXPECT_EQ(failures[0].key, "bad");
    EXPECT_EQ(failures[0].operatorName, "sum");
    ASSERT_TRUE(failures[0].window.has_value());
    EXPECT_EQ(failures[0].window.value(), Window(5000, 5001));

    EXPECT_TRUE(processor->isAbandoned(std::string("bad")));
    EXPECT_FALSE(processor->isAbandoned(std::string("good")));
    EXPECT_TRUE(store->getWindowsOfKey(std::string("bad")).empty());

    // later elements of the abandoned key are ignored
    processor->onElement(element("bad", 9, 20));
    processor->onElement(element("good", 2, 20));

    auto sums = results(processor->onWatermark(WatermarkGenerator::FINAL_WATERMARK));
    ASSERT_EQ(sums.size(), 1u);
    EXPECT_EQ((sums[{Window(0, 100), "good"}]), 3);
}

TEST_F(KeyedWindowProcessorTest, lateElementsAreDroppedAndCounted) {
    auto processor = createProcessor(TumblingWindowing::of(1000));
    processor->onElement(element("a", 1, 1500));
    auto fired = results(processor->onWatermark(2000));
    EXPECT_EQ((fired[{Window(1000, 2000), "a"}]), 1);

    processor->onElement(element("a", 5, 1200));
    EXPECT_EQ(processor->getNumberOfDroppedLateElements(), 1u);
    processor->onElement(element("a", 7, 2500));

    // a watermark that does not advance fires nothing
    EXPECT_TRUE(processor->onWatermark(1500).empty());
    EXPECT_EQ(processor->getLastWatermark(), 2000u);

    auto sums = results(processor->onWatermark(WatermarkGenerator::FINAL_WATERMARK));
    ASSERT_EQ(sums.size(), 1u);
    EXPECT_EQ((sums[{Window(2000, 3000), "a"}]), 7);
}

TEST_F(KeyedWindowProcessorTest, elementsBetweenSlidingWindowsAreNotLate) {
    // windows of size 10 every 100 leave the range [10, 100) uncovered
    auto processor = createProcessor(SlidingWindowing::of(10, 100));
    processor->onElement(element("a", 1, 5));
    EXPECT_TRUE(processor->onWatermark(1).empty());
    processor->onElement(element("a", 2, 50));
    processor->onElement(element("a", 3, 105));
    EXPECT_EQ(processor->getNumberOfDroppedLateElements(), 0u);

    auto sums = results(processor->onWatermark(WatermarkGenerator::FINAL_WATERMARK));
    ASSERT_EQ(sums.size(), 2u);
    EXPECT_EQ((sums[{Window(0, 10), "a"}]), 1);
    EXPECT_EQ((sums[{Window(100, 110), "a"}]), 3);
    EXPECT_TRUE(failures.empty());
}

TEST_F(KeyedWindowProcessorTest, corruptedSpillRecordRestartsTheAccumulator) {
    auto processor = createProcessor(TumblingWindowing::of(1000), 1);
    processor->onElement(element("a", 1, 100));
    processor->onElement(element("b", 2, 100));
    ASSERT_EQ(storage->getNumberOfRecords(), 1u);
    storage->overwrite(storage->getRecordIds().front(), "garbage");

    processor->onElement(element("a", 10, 200));
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].kind, Exceptions::FailureKind::STATE_CORRUPTION);
    EXPECT_EQ(failures[0].key, "a");

    auto sums = results(processor->onWatermark(WatermarkGenerator::FINAL_WATERMARK));
    ASSERT_EQ(sums.size(), 2u);
    EXPECT_EQ((sums[{Window(0, 1000), "a"}]), 10);
    EXPECT_EQ((sums[{Window(0, 1000), "b"}]), 2);
}

TEST_F(KeyedWindowProcessorTest, spilledStateSurvivesUntilTheWindowFires) {
    auto processor = createProcessor(TumblingWindowing::of(100), 2);
    for (int64_t i = 0; i < 10; ++i) {
        processor->onElement(element("key" + std::to_string(i), i, 50));
    }
    for (int64_t i = 0; i < 10; ++i) {
        processor->onElement(element("key" + std::to_string(i), i, 60));
    }
    EXPECT_GT(storage->getNumberOfWrites(), 0u);

    auto sums = results(processor->onWatermark(100));
    ASSERT_EQ(sums.size(), 10u);
    for (int64_t i = 0; i < 10; ++i) {
        EXPECT_EQ((sums[{Window(0, 100), "key" + std::to_string(i)}]), 2 * i);
    }
    EXPECT_EQ(storage->getNumberOfRecords(), 0u);
}

}// namespace DFE::Windowing
