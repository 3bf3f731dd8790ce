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

#ifndef DFE_CORE_INCLUDE_LOWERING_LOWERFLOWTODAGPHASE_HPP_
#define DFE_CORE_INCLUDE_LOWERING_LOWERFLOWTODAGPHASE_HPP_

#include <Lowering/AcceptorContext.hpp>
#include <Lowering/TranslationRuleTable.hpp>
#include <Operators/OperatorDecomposition.hpp>
#include <Plans/CanonicalDag.hpp>
#include <Plans/FlowGraph.hpp>
#include <map>
#include <memory>
#include <vector>

namespace DFE::Lowering {

class LowerFlowToDagPhase;
using LowerFlowToDagPhasePtr = std::shared_ptr<LowerFlowToDagPhase>;

/**
 * @brief Expands an operator into simpler operators, see OperatorDecomposition::decompose.
 */
using Decomposer = std::function<std::optional<std::vector<LogicalOperatorPtr>>(const LogicalOperatorPtr& logicalOperator,
                                                                               const OperatorIdGenerator& nextId)>;

/**
 * @brief This phase lowers a flow graph into a canonical DAG.
 * Every operator is bound to the first rule of its kind that accepts it.
 * If no rule accepts an operator, the operator is decomposed and its parts are lowered recursively.
 * The sink of a decomposed operator moves to the last part of its decomposition.
 */
class LowerFlowToDagPhase {
  public:
    /**
     * @brief Constructor to create a LowerFlowToDagPhase
     * @param ruleTable the translation rules
     * @param context information for the acceptance predicates
     * @param maxDecompositionDepth maximal nesting of decompositions
     * @param decomposer expands operators that no rule accepts
     */
    LowerFlowToDagPhase(TranslationRuleTablePtr ruleTable,
                        AcceptorContextPtr context,
                        uint64_t maxDecompositionDepth,
                        Decomposer decomposer = OperatorDecomposition::decompose);

    static LowerFlowToDagPhasePtr create(TranslationRuleTablePtr ruleTable,
                                         AcceptorContextPtr context,
                                         uint64_t maxDecompositionDepth,
                                         Decomposer decomposer = OperatorDecomposition::decompose);

    /**
     * @brief Applies the phase on a flow graph.
     * Operators created by decompositions receive ids following the largest id of the flow graph,
     * so lowering a flow graph twice creates equal DAGs.
     * @param flowGraph the flow graph, it is not modified
     * @return the canonical DAG
     * @throws UnsupportedOperatorException if an operator is neither accepted by a rule nor decomposable
     * @throws LoweringException if a decomposition re-introduces a kind that is being expanded or nests too deep
     */
    CanonicalDagPtr apply(const FlowGraphPtr& flowGraph) const;

  private:
    /**
     * @brief State of one application of the phase.
     */
    struct LoweringState {
        CanonicalDagPtr dag;
        std::map<OperatorId, DagNodeId> nodeOfOperator;
        std::vector<OperatorKind> expandingKinds;
        OperatorIdGenerator nextId;
    };

    DagNodeId lower(const LogicalOperatorPtr& logicalOperator, uint64_t depth, LoweringState& state) const;

    TranslationRuleTablePtr ruleTable;
    AcceptorContextPtr context;
    uint64_t maxDecompositionDepth;
    Decomposer decomposer;
};

}// namespace DFE::Lowering

#endif// DFE_CORE_INCLUDE_LOWERING_LOWERFLOWTODAGPHASE_HPP_
