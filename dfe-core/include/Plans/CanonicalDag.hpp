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

#ifndef DFE_CORE_INCLUDE_PLANS_CANONICALDAG_HPP_
#define DFE_CORE_INCLUDE_PLANS_CANONICALDAG_HPP_

#include <Lowering/TranslationRule.hpp>
#include <Operators/LogicalOperator.hpp>
#include <Sinks/DataSink.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace DFE {

using DagNodeId = uint64_t;

/**
 * @brief A node of the canonical DAG: an accepted operator bound to the rule that lowers it.
 */
struct DagNode {
    DagNodeId id;
    LogicalOperatorPtr logicalOperator;
    Lowering::TranslationRulePtr rule;
    std::vector<DagNodeId> dependencies;
    std::vector<DagNodeId> consumers;
    // nullptr if the output of the node is not handed to a sink
    Sinks::DataSinkPtr sink;
};

class CanonicalDag;
using CanonicalDagPtr = std::shared_ptr<CanonicalDag>;

/**
 * @brief The result of lowering a flow graph.
 * Node ids are the positions in the node list and every node only depends on nodes with smaller ids,
 * so the node order is a topological order.
 */
class CanonicalDag {
  public:
    static CanonicalDagPtr create();

    /**
     * @brief Appends a node and registers it as consumer of its dependencies.
     * @return the id of the new node
     */
    DagNodeId addNode(LogicalOperatorPtr logicalOperator, Lowering::TranslationRulePtr rule, std::vector<DagNodeId> dependencies);

    void attachSink(DagNodeId id, Sinks::DataSinkPtr sink);

    [[nodiscard]] const std::vector<DagNode>& getNodes() const { return nodes; }

    [[nodiscard]] const DagNode& getNode(DagNodeId id) const;

    [[nodiscard]] uint64_t getNumberOfNodes() const { return nodes.size(); }

    /**
     * @brief Returns the number of consumers of a node.
     */
    [[nodiscard]] uint64_t getFanOut(DagNodeId id) const;

    /**
     * @brief Returns the nodes without consumers in node order.
     */
    [[nodiscard]] std::vector<DagNodeId> getLeaves() const;

    /**
     * @brief Returns a structural description of the DAG.
     * Two lowerings of the same flow graph produce equal strings.
     */
    [[nodiscard]] std::string toString() const;

  private:
    std::vector<DagNode> nodes;
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_PLANS_CANONICALDAG_HPP_
