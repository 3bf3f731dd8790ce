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

#ifndef DFE_CORE_INCLUDE_PLANS_FLOWGRAPH_HPP_
#define DFE_CORE_INCLUDE_PLANS_FLOWGRAPH_HPP_

#include <Operators/LogicalOperator.hpp>
#include <Sinks/DataSink.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace DFE {

class FlowGraph;
using FlowGraphPtr = std::shared_ptr<FlowGraph>;

/**
 * @brief The operator graph authored by a user.
 * Operators are kept in insertion order and an operator can only be added after all of its inputs,
 * so the insertion order is a topological order and the graph is acyclic by construction.
 * Lowering only reads the flow graph.
 */
class FlowGraph {
  public:
    explicit FlowGraph(std::string name);

    static FlowGraphPtr create(std::string name);

    /**
     * @brief Appends an operator.
     * @param logicalOperator the operator
     * @throws LoweringException if an input was not added before, an input has a sink or the id is already used
     */
    void addOperator(const LogicalOperatorPtr& logicalOperator);

    /**
     * @brief Attaches a sink that receives the output of the operator.
     * Only leaves receive sinks, an operator with a sink cannot be consumed by later operators.
     * @throws LoweringException if the operator is not part of the graph, has consumers or already has a sink
     */
    void attachSink(const LogicalOperatorPtr& logicalOperator, Sinks::DataSinkPtr sink);

    [[nodiscard]] const std::string& getName() const { return name; }

    [[nodiscard]] const std::vector<LogicalOperatorPtr>& getOperators() const { return operators; }

    [[nodiscard]] bool contains(OperatorId id) const;

    /**
     * @brief Returns true if an operator of the graph reads the output of the operator with this id.
     */
    [[nodiscard]] bool hasConsumers(OperatorId id) const;

    /**
     * @brief Returns the sink of an operator, nullptr if it has none.
     */
    [[nodiscard]] Sinks::DataSinkPtr getSink(OperatorId id) const;

    /**
     * @brief Returns the largest operator id of the graph, 0 for an empty graph.
     */
    [[nodiscard]] OperatorId getMaxOperatorId() const;

    [[nodiscard]] std::string toString() const;

  private:
    std::string name;
    std::vector<LogicalOperatorPtr> operators;
    std::map<OperatorId, Sinks::DataSinkPtr> sinks;
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_PLANS_FLOWGRAPH_HPP_
