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

#include <Execution/Translators/BroadcastHashJoinTranslator.hpp>
#include <Execution/Translators/FlatMapTranslator.hpp>
#include <Execution/Translators/InputTranslator.hpp>
#include <Execution/Translators/ReduceByKeyTranslator.hpp>
#include <Execution/Translators/ReduceStateByKeyTranslator.hpp>
#include <Execution/Translators/SortMergeJoinTranslator.hpp>
#include <Execution/Translators/UnionTranslator.hpp>
#include <Lowering/DefaultTranslationRules.hpp>

namespace DFE::Lowering {

namespace {
bool isMerging(const LogicalOperator& logicalOperator) {
    return logicalOperator.getWindowing() && logicalOperator.getWindowing()->isMerging();
}
}// namespace

bool DefaultTranslationRules::acceptsReduceByKey(const LogicalOperator& logicalOperator, const AcceptorContext&) {
    return logicalOperator.as<ReduceByKeyDescriptor>().combinable && !isMerging(logicalOperator);
}

bool DefaultTranslationRules::acceptsBroadcastHashJoin(const LogicalOperator& logicalOperator, const AcceptorContext& context) {
    if (logicalOperator.getWindowing()) {
        return false;
    }
    return Execution::BroadcastHashJoinTranslator::selectBroadcastSide(logicalOperator, context.getBroadcastJoinThreshold())
        .has_value();
}

bool DefaultTranslationRules::acceptsSortMergeJoin(const LogicalOperator& logicalOperator, const AcceptorContext& context) {
    return !isMerging(logicalOperator) && context.hasComparator(logicalOperator.as<JoinDescriptor>().keyType);
}

TranslationRuleTablePtr DefaultTranslationRules::create() {
    return TranslationRuleTable::builder()
        .addRule("InputTranslator", OperatorKind::INPUT, Execution::InputTranslator::create())
        .addRule("FlatMapTranslator", OperatorKind::FLAT_MAP, Execution::FlatMapTranslator::create())
        .addRule("UnionTranslator", OperatorKind::UNION, Execution::UnionTranslator::create())
        .addRule("ReduceStateByKeyTranslator", OperatorKind::REDUCE_STATE_BY_KEY, Execution::ReduceStateByKeyTranslator::create())
        .addRule("ReduceByKeyTranslator",
                 OperatorKind::REDUCE_BY_KEY,
                 acceptsReduceByKey,
                 Execution::ReduceByKeyTranslator::create())
        .addRule("BroadcastHashJoinTranslator",
                 OperatorKind::JOIN,
                 acceptsBroadcastHashJoin,
                 Execution::BroadcastHashJoinTranslator::create())
        .addRule("SortMergeJoinTranslator", OperatorKind::JOIN, acceptsSortMergeJoin, Execution::SortMergeJoinTranslator::create())
        .build();
}

}// namespace DFE::Lowering
