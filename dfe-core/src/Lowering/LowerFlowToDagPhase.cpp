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

#include <Exceptions/LoweringException.hpp>
#include <Exceptions/UnsupportedOperatorException.hpp>
#include <Lowering/LowerFlowToDagPhase.hpp>
#include <Util/Logger/Logger.hpp>
#include <algorithm>

namespace DFE::Lowering {

LowerFlowToDagPhase::LowerFlowToDagPhase(TranslationRuleTablePtr ruleTable,
                                         AcceptorContextPtr context,
                                         uint64_t maxDecompositionDepth,
                                         Decomposer decomposer)
    : ruleTable(std::move(ruleTable)), context(std::move(context)), maxDecompositionDepth(maxDecompositionDepth),
      decomposer(std::move(decomposer)) {
    DFE_ASSERT(this->ruleTable && this->context, "LowerFlowToDagPhase requires a rule table and an acceptor context");
}

LowerFlowToDagPhasePtr LowerFlowToDagPhase::create(TranslationRuleTablePtr ruleTable,
                                                   AcceptorContextPtr context,
                                                   uint64_t maxDecompositionDepth,
                                                   Decomposer decomposer) {
    return std::make_shared<LowerFlowToDagPhase>(std::move(ruleTable),
                                                 std::move(context),
                                                 maxDecompositionDepth,
                                                 std::move(decomposer));
}

CanonicalDagPtr LowerFlowToDagPhase::apply(const FlowGraphPtr& flowGraph) const {
    DFE_DEBUG("LowerFlowToDagPhase: lower " << flowGraph->toString());
    auto nextFreeId = std::make_shared<OperatorId>(flowGraph->getMaxOperatorId() + 1);
    LoweringState state{CanonicalDag::create(), {}, {}, [nextFreeId]() {
                            return (*nextFreeId)++;
                        }};

    for (const auto& logicalOperator : flowGraph->getOperators()) {
        auto nodeId = lower(logicalOperator, 0, state);
        if (auto sink = flowGraph->getSink(logicalOperator->getId())) {
            state.dag->attachSink(nodeId, sink);
        }
    }
    DFE_DEBUG("LowerFlowToDagPhase: lowered " << flowGraph->getName() << " into" << std::endl << state.dag->toString());
    return state.dag;
}

DagNodeId LowerFlowToDagPhase::lower(const LogicalOperatorPtr& logicalOperator, uint64_t depth, LoweringState& state) const {
    auto kind = logicalOperator->getKind();
    for (const auto& rule : ruleTable->getRules(kind)) {
        if (!rule->accepts(*logicalOperator, *context)) {
            DFE_TRACE("LowerFlowToDagPhase: rule " << rule->getName() << " rejects " << logicalOperator->toString());
            continue;
        }
        std::vector<DagNodeId> dependencies;
        for (const auto& input : logicalOperator->getInputs()) {
            dependencies.emplace_back(state.nodeOfOperator.at(input->getId()));
        }
        auto nodeId = state.dag->addNode(logicalOperator, rule, std::move(dependencies));
        state.nodeOfOperator[logicalOperator->getId()] = nodeId;
        DFE_DEBUG("LowerFlowToDagPhase: " << logicalOperator->toString() << " is lowered by " << rule->getName());
        return nodeId;
    }

    if (std::find(state.expandingKinds.begin(), state.expandingKinds.end(), kind) != state.expandingKinds.end()) {
        throw Exceptions::LoweringException("decomposition of " + logicalOperator->getName() + " re-introduces "
                                            + DFE::toString(kind) + " while it is being expanded");
    }
    auto parts = decomposer(logicalOperator, state.nextId);
    if (!parts || parts->empty()) {
        throw Exceptions::UnsupportedOperatorException(kind, logicalOperator->getName());
    }
    if (depth + 1 > maxDecompositionDepth) {
        throw Exceptions::LoweringException("decomposition of " + logicalOperator->getName() + " exceeds the maximal depth of "
                                            + std::to_string(maxDecompositionDepth));
    }

    state.expandingKinds.emplace_back(kind);
    DagNodeId outputNode = 0;
    for (const auto& part : *parts) {
        outputNode = lower(part, depth + 1, state);
    }
    state.expandingKinds.pop_back();

    state.nodeOfOperator[logicalOperator->getId()] = outputNode;
    return outputNode;
}

}// namespace DFE::Lowering
