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
#include <Exceptions/LoweringException.hpp>
#include <Exceptions/UnsupportedOperatorException.hpp>
#include <Execution/DataSet.hpp>
#include <Execution/OperatorTranslator.hpp>
#include <Lowering/LowerFlowToDagPhase.hpp>
#include <Operators/LogicalOperatorFactory.hpp>
#include <Sinks/CollectSink.hpp>
#include <Sources/MemorySource.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/WindowedElement.hpp>
#include <gtest/gtest.h>

namespace DFE::Lowering {

namespace {

class NoopTranslator : public Execution::OperatorTranslator {
  public:
    static Execution::OperatorTranslatorPtr create() { return std::make_shared<NoopTranslator>(); }

    Execution::DataSetPtr translate(const LogicalOperatorPtr& logicalOperator,
                                    const std::vector<Execution::DataSetPtr>&,
                                    const Execution::ExecutionContextPtr&) override {
        return Execution::DataSet::create(logicalOperator->getName(), []() {
            return std::vector<Windowing::WindowedElement>();
        });
    }
};

TranslationRuleTablePtr basicRules() {
    return TranslationRuleTable::builder()
        .addRule("input", OperatorKind::INPUT, NoopTranslator::create())
        .addRule("flatMap", OperatorKind::FLAT_MAP, NoopTranslator::create())
        .addRule("union", OperatorKind::UNION, NoopTranslator::create())
        .addRule("stateByKey", OperatorKind::REDUCE_STATE_BY_KEY, NoopTranslator::create())
        .build();
}

std::any identity(const std::any& value) { return value; }

}// namespace

class LowerFlowToDagPhaseTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("LowerFlowToDagPhaseTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup LowerFlowToDagPhaseTest test class.");
    }

    void SetUp() override {
        Testing::DfeBaseTest::SetUp();
        context = AcceptorContext::create(KeyComparators::create(), 100);
        flowGraph = FlowGraph::create("test");
        input = LogicalOperatorFactory::createInputOperator("input",
                                                            Sources::MemorySource::create({int64_t{1}, int64_t{2}}),
                                                            OperatorHints::none(),
                                                            1);
        flowGraph->addOperator(input);
    }

    AcceptorContextPtr context;
    FlowGraphPtr flowGraph;
    LogicalOperatorPtr input;
};

TEST_F(LowerFlowToDagPhaseTest, firstAcceptingRuleWins) {
    auto flatMap = LogicalOperatorFactory::createFlatMapOperator("flatMap",
                                                                 input,
                                                                 [](const std::any&, Collector&) {},
                                                                 std::nullopt,
                                                                 OperatorHints::none(),
                                                                 2);
    flowGraph->addOperator(flatMap);

    auto rules = TranslationRuleTable::builder()
                     .addRule("input", OperatorKind::INPUT, NoopTranslator::create())
                     .addRule(
                         "rejecting",
                         OperatorKind::FLAT_MAP,
                         [](const LogicalOperator&, const AcceptorContext&) {
                             return false;
                         },
                         NoopTranslator::create())
                     .addRule(
                         "accepting",
                         OperatorKind::FLAT_MAP,
                         [](const LogicalOperator&, const AcceptorContext&) {
                             return true;
                         },
                         NoopTranslator::create())
                     .addRule("fallback", OperatorKind::FLAT_MAP, NoopTranslator::create())
                     .build();
    EXPECT_EQ(rules->getNumberOfRules(), 4u);

    auto dag = LowerFlowToDagPhase::create(rules, context, 8)->apply(flowGraph);
    ASSERT_EQ(dag->getNumberOfNodes(), 2u);
    EXPECT_EQ(dag->getNode(0).rule->getName(), "input");
    EXPECT_EQ(dag->getNode(1).rule->getName(), "accepting");
    EXPECT_EQ(dag->getNode(1).dependencies, std::vector<DagNodeId>{0});
    EXPECT_EQ(dag->getFanOut(0), 1u);
}

TEST_F(LowerFlowToDagPhaseTest, ruleOfAnotherKindNeverAccepts) {
    auto rule = TranslationRule::create("flatMap", OperatorKind::FLAT_MAP, std::nullopt, NoopTranslator::create());
    EXPECT_FALSE(rule->accepts(*input, *context));
    EXPECT_FALSE(rule->hasPredicate());
}

TEST_F(LowerFlowToDagPhaseTest, unacceptedOperatorIsDecomposedAndKeepsItsSink) {
    auto map = LogicalOperatorFactory::createMapOperator("map", input, identity, OperatorHints::none(), 2);
    flowGraph->addOperator(map);
    auto sink = Sinks::CollectSink::create();
    flowGraph->attachSink(map, sink);

    auto dag = LowerFlowToDagPhase::create(basicRules(), context, 8)->apply(flowGraph);
    ASSERT_EQ(dag->getNumberOfNodes(), 2u);
    const auto& node = dag->getNode(1);
    EXPECT_EQ(node.logicalOperator->getKind(), OperatorKind::FLAT_MAP);
    EXPECT_EQ(node.logicalOperator->getName(), "map.flatMap");
    // parts of a decomposition get ids after the largest id of the flow graph
    EXPECT_EQ(node.logicalOperator->getId(), 3u);
    EXPECT_EQ(node.sink, sink);
    EXPECT_EQ(dag->getLeaves(), std::vector<DagNodeId>{1});
}

TEST_F(LowerFlowToDagPhaseTest, loweringIsDeterministic) {
    SumByKeyDescriptor descriptor{identity,
                                  [](const std::any& value) {
                                      return std::any_cast<int64_t>(value);
                                  },
                                  State::Int64Serde::create()};
    auto sum = LogicalOperatorFactory::createSumByKeyOperator("sum", input, descriptor, nullptr, OperatorHints::none(), 2);
    flowGraph->addOperator(sum);
    flowGraph->attachSink(sum, Sinks::CollectSink::create());

    auto phase = LowerFlowToDagPhase::create(basicRules(), context, 8);
    auto first = phase->apply(flowGraph);
    auto second = phase->apply(flowGraph);
    EXPECT_EQ(first->toString(), second->toString());
    EXPECT_EQ(first->getNode(1).logicalOperator->getId(), second->getNode(1).logicalOperator->getId());
    EXPECT_EQ(first->getNumberOfNodes(), 2u);
    EXPECT_EQ(first->getNode(1).logicalOperator->getName(), "sum.reduceByKey.stateByKey");
}

TEST_F(LowerFlowToDagPhaseTest, rejectedBasicOperatorIsUnsupported) {
    auto flatMap = LogicalOperatorFactory::createFlatMapOperator("flatMap",
                                                                 input,
                                                                 [](const std::any&, Collector&) {},
                                                                 std::nullopt,
                                                                 OperatorHints::none(),
                                                                 2);
    flowGraph->addOperator(flatMap);
    auto rules = TranslationRuleTable::builder()
                     .addRule("input", OperatorKind::INPUT, NoopTranslator::create())
                     .addRule(
                         "never",
                         OperatorKind::FLAT_MAP,
                         [](const LogicalOperator&, const AcceptorContext&) {
                             return false;
                         },
                         NoopTranslator::create())
                     .build();
    try {
        LowerFlowToDagPhase::create(rules, context, 8)->apply(flowGraph);
        FAIL();
    } catch (const Exceptions::UnsupportedOperatorException& e) {
        EXPECT_EQ(e.getKind(), OperatorKind::FLAT_MAP);
        EXPECT_EQ(e.getOperatorName(), "flatMap");
    }
}

TEST_F(LowerFlowToDagPhaseTest, decompositionCycleIsDetected) {
    auto map = LogicalOperatorFactory::createMapOperator("map", input, identity, OperatorHints::none(), 2);
    flowGraph->addOperator(map);
    Decomposer cyclic = [](const LogicalOperatorPtr& op, const OperatorIdGenerator& nextId) {
        return std::optional<std::vector<LogicalOperatorPtr>>(
            std::vector<LogicalOperatorPtr>{LogicalOperatorFactory::createMapOperator(op->getName() + ".again",
                                                                                      op->getInputs().front(),
                                                                                      op->as<MapDescriptor>().function,
                                                                                      OperatorHints::none(),
                                                                                      nextId())});
    };
    EXPECT_THROW(LowerFlowToDagPhase::create(basicRules(), context, 8, cyclic)->apply(flowGraph), Exceptions::LoweringException);
}

TEST_F(LowerFlowToDagPhaseTest, decompositionDepthIsBounded) {
    SumByKeyDescriptor descriptor{identity,
                                  [](const std::any& value) {
                                      return std::any_cast<int64_t>(value);
                                  },
                                  State::Int64Serde::create()};
    auto sum = LogicalOperatorFactory::createSumByKeyOperator("sum", input, descriptor, nullptr, OperatorHints::none(), 2);
    flowGraph->addOperator(sum);

    // SUM_BY_KEY expands to REDUCE_BY_KEY which expands to REDUCE_STATE_BY_KEY
    EXPECT_THROW(LowerFlowToDagPhase::create(basicRules(), context, 1)->apply(flowGraph), Exceptions::LoweringException);
    EXPECT_NO_THROW(LowerFlowToDagPhase::create(basicRules(), context, 2)->apply(flowGraph));
}

TEST_F(LowerFlowToDagPhaseTest, duplicateRuleNameIsRejected) {
    auto builder = TranslationRuleTable::builder();
    builder.addRule("input", OperatorKind::INPUT, NoopTranslator::create());
    EXPECT_THROW(builder.addRule("input", OperatorKind::INPUT, NoopTranslator::create()), Exceptions::RuntimeException);
    EXPECT_TRUE(basicRules()->getRules(OperatorKind::JOIN).empty());
}

}// namespace DFE::Lowering
