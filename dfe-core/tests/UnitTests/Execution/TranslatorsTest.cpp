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
#include <Execution/Translators/BroadcastHashJoinTranslator.hpp>
#include <Execution/Translators/FlatMapTranslator.hpp>
#include <Execution/Translators/InputTranslator.hpp>
#include <Execution/Translators/ReduceByKeyTranslator.hpp>
#include <Execution/Translators/UnionTranslator.hpp>
#include <InMemorySpillStorage.hpp>
#include <Operators/LogicalOperatorFactory.hpp>
#include <TestFlows.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/WindowTypes/TumblingWindowing.hpp>
#include <gtest/gtest.h>

namespace DFE::Execution {

using Windowing::KeyValue;
using Windowing::Window;
using Windowing::WindowedElement;

class TranslatorsTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("TranslatorsTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup TranslatorsTest test class.");
    }

    void SetUp() override {
        Testing::DfeBaseTest::SetUp();
        context = std::make_shared<ExecutionContext>(100,
                                                     0,
                                                     1,
                                                     Testing::InMemorySpillStorageFactory::create(false),
                                                     KeyComparators::create());
        placeholder = LogicalOperatorFactory::createInputOperator("placeholder", Sources::MemorySource::create({}));
    }

    static DataSetPtr dataSetOf(std::vector<WindowedElement> elements) {
        return DataSet::create("elements", [elements]() {
            return elements;
        });
    }

    ExecutionContextPtr context;
    LogicalOperatorPtr placeholder;
};

TEST_F(TranslatorsTest, inputReadsTheSource) {
    auto input = LogicalOperatorFactory::createInputOperator(
        "input",
        Sources::MemorySource::createTimestamped({{std::string("a"), 5}, {std::string("b"), 7}}));
    auto elements = InputTranslator::create()->translate(input, {}, context)->compute();
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(std::any_cast<std::string>(elements[1].getValue()), "b");
    EXPECT_EQ(elements[1].getTimestamp(), 7u);
}

TEST_F(TranslatorsTest, flatMapKeepsWindowsAndAssignsEventTime) {
    auto flatMap = LogicalOperatorFactory::createFlatMapOperator(
        "split",
        placeholder,
        [](const std::any& value, Collector& collector) {
            auto number = std::any_cast<int64_t>(value);
            collector.collect(number);
            collector.collect(number + 1);
        },
        [](const std::any& value) {
            return static_cast<uint64_t>(std::any_cast<int64_t>(value) * 100);
        });
    auto input = dataSetOf({WindowedElement(int64_t{3}, 1, {Window(0, 10)})});
    auto elements = FlatMapTranslator::create()->translate(flatMap, {input}, context)->compute();
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(std::any_cast<int64_t>(elements[1].getValue()), 4);
    EXPECT_EQ(elements[0].getTimestamp(), 300u);
    EXPECT_EQ(elements[1].getTimestamp(), 300u);
    EXPECT_EQ(elements[1].getWindows(), std::vector<Window>{Window(0, 10)});
}

TEST_F(TranslatorsTest, unionOrdersByTimestamp) {
    auto both = LogicalOperatorFactory::createUnionOperator("union", {placeholder, placeholder});
    auto first = dataSetOf({WindowedElement(std::string("first-5"), 5), WindowedElement(std::string("first-1"), 1)});
    auto second = dataSetOf({WindowedElement(std::string("second-3"), 3), WindowedElement(std::string("second-5"), 5)});
    auto elements = UnionTranslator::create()->translate(both, {first, second}, context)->compute();
    std::vector<std::string> values;
    for (const auto& element : elements) {
        values.emplace_back(std::any_cast<std::string>(element.getValue()));
    }
    EXPECT_EQ(values, (std::vector<std::string>{"first-1", "second-3", "first-5", "second-5"}));
}

static LogicalOperatorPtr createWindowedSum(const LogicalOperatorPtr& input, uint64_t size) {
    ReduceByKeyDescriptor descriptor{Testing::keyOfPair,
                                     [](const std::any& value) {
                                         return std::any_cast<const KeyValue&>(value).second;
                                     },
                                     [](const std::vector<std::any>& values) {
                                         int64_t sum = 0;
                                         for (const auto& value : values) {
                                             sum += std::any_cast<int64_t>(value);
                                         }
                                         return std::any(sum);
                                     },
                                     true,
                                     State::StringSerde::create(),
                                     State::Int64Serde::create()};
    return LogicalOperatorFactory::createReduceByKeyOperator("sum", input, descriptor, Windowing::TumblingWindowing::of(size));
}

static std::vector<std::string> toWindowedSums(const std::vector<WindowedElement>& elements) {
    std::vector<std::string> results;
    for (const auto& element : elements) {
        const auto& kv = std::any_cast<const KeyValue&>(element.getValue());
        results.emplace_back(element.getWindows().front().toString() + " " + std::any_cast<std::string>(kv.first) + "="
                             + std::to_string(std::any_cast<int64_t>(kv.second)));
    }
    return results;
}

TEST_F(TranslatorsTest, reduceByKeyAggregatesPerWindow) {
    auto reduce = createWindowedSum(placeholder, 10);
    auto input = dataSetOf({WindowedElement(KeyValue(std::string("a"), int64_t{1}), 1),
                            WindowedElement(KeyValue(std::string("a"), int64_t{2}), 5),
                            WindowedElement(KeyValue(std::string("b"), int64_t{3}), 12),
                            WindowedElement(KeyValue(std::string("a"), int64_t{4}), 15)});
    auto elements = ReduceByKeyTranslator::create()->translate(reduce, {input}, context)->compute();
    ASSERT_EQ(elements.size(), 3u);
    EXPECT_EQ(toWindowedSums(elements), (std::vector<std::string>{"[0, 10) a=3", "[10, 20) a=4", "[10, 20) b=3"}));
    EXPECT_EQ(elements[0].getTimestamp(), 9u);
    EXPECT_EQ(context->getFailureCollector()->getReport().droppedLateElements, 0u);
}

TEST_F(TranslatorsTest, reduceByKeyDropsElementsBehindTheWatermark) {
    auto reduce = createWindowedSum(placeholder, 10);
    // the element at 12 advances the watermark past the end of [0, 10)
    auto input = dataSetOf({WindowedElement(KeyValue(std::string("b"), int64_t{3}), 12),
                            WindowedElement(KeyValue(std::string("a"), int64_t{1}), 1),
                            WindowedElement(KeyValue(std::string("a"), int64_t{4}), 15),
                            WindowedElement(KeyValue(std::string("a"), int64_t{2}), 5)});
    auto elements = ReduceByKeyTranslator::create()->translate(reduce, {input}, context)->compute();
    EXPECT_EQ(toWindowedSums(elements), (std::vector<std::string>{"[10, 20) a=4", "[10, 20) b=3"}));
    EXPECT_EQ(context->getFailureCollector()->getReport().droppedLateElements, 2u);
}

TEST_F(TranslatorsTest, reduceByKeyKeepsLateElementsWithinTheAllowedLateness) {
    auto lenientContext = std::make_shared<ExecutionContext>(100,
                                                             20,
                                                             1,
                                                             Testing::InMemorySpillStorageFactory::create(false),
                                                             KeyComparators::create());
    auto reduce = createWindowedSum(placeholder, 10);
    auto input = dataSetOf({WindowedElement(KeyValue(std::string("b"), int64_t{3}), 12),
                            WindowedElement(KeyValue(std::string("a"), int64_t{1}), 1),
                            WindowedElement(KeyValue(std::string("a"), int64_t{2}), 5)});
    auto elements = ReduceByKeyTranslator::create()->translate(reduce, {input}, lenientContext)->compute();
    EXPECT_EQ(toWindowedSums(elements), (std::vector<std::string>{"[0, 10) a=3", "[10, 20) b=3"}));
    EXPECT_EQ(lenientContext->getFailureCollector()->getReport().droppedLateElements, 0u);
}

TEST_F(TranslatorsTest, broadcastJoinProbesTheLargeSide) {
    auto large = LogicalOperatorFactory::createInputOperator("large",
                                                             Testing::createPairSource({{"a", "l1"}, {"b", "l2"}, {"c", "l3"}}),
                                                             OperatorHints::withSize(1000));
    auto small = LogicalOperatorFactory::createInputOperator("small", Testing::createPairSource({{"a", "r1"}, {"a", "r2"}}));
    auto join =
        LogicalOperatorFactory::createJoinOperator("join", large, small, Testing::createPairJoinDescriptor(JoinType::LEFT));
    auto inputTranslator = InputTranslator::create();
    auto output = BroadcastHashJoinTranslator::create()
                      ->translate(join,
                                  {inputTranslator->translate(large, {}, context), inputTranslator->translate(small, {}, context)},
                                  context)
                      ->compute();
    std::vector<std::any> values;
    for (const auto& element : output) {
        values.emplace_back(element.getValue());
    }
    EXPECT_EQ(Testing::sortedJoinResults(values), (std::vector<std::string>{"a:l1|r1", "a:l1|r2", "b:l2|-", "c:l3|-"}));
}

TEST_F(TranslatorsTest, broadcastJoinBroadcastsTheSmallerInnerSide) {
    // both sides qualify for a lowering threshold of 5000
    auto left = LogicalOperatorFactory::createInputOperator("left",
                                                            Testing::createPairSource({{"a", "l1"}, {"b", "l2"}}),
                                                            OperatorHints::withSize(1000));
    auto right = LogicalOperatorFactory::createInputOperator("right",
                                                             Testing::createPairSource({{"a", "r1"}, {"c", "r2"}}),
                                                             OperatorHints::withSize(3000));
    auto join =
        LogicalOperatorFactory::createJoinOperator("join", left, right, Testing::createPairJoinDescriptor(JoinType::INNER));
    EXPECT_EQ(BroadcastHashJoinTranslator::selectBroadcastSide(*join, 5000), std::optional(JoinSide::LEFT));

    auto inputTranslator = InputTranslator::create();
    auto output = BroadcastHashJoinTranslator::create()
                      ->translate(join,
                                  {inputTranslator->translate(left, {}, context), inputTranslator->translate(right, {}, context)},
                                  context)
                      ->compute();
    std::vector<std::any> values;
    for (const auto& element : output) {
        values.emplace_back(element.getValue());
    }
    EXPECT_EQ(Testing::sortedJoinResults(values), std::vector<std::string>{"a:l1|r1"});
}

TEST_F(TranslatorsTest, broadcastJoinWithoutCompatibleSideFails) {
    auto large = LogicalOperatorFactory::createInputOperator("large",
                                                             Testing::createPairSource({{"a", "l1"}}),
                                                             OperatorHints::withSize(1000));
    // both sides of a full join are outer sides
    auto join = LogicalOperatorFactory::createJoinOperator("join", large, large, Testing::createPairJoinDescriptor(JoinType::FULL));
    auto input = InputTranslator::create()->translate(large, {}, context);
    EXPECT_THROW(BroadcastHashJoinTranslator::create()->translate(join, {input, input}, context), Exceptions::RuntimeException);
}

}// namespace DFE::Execution
