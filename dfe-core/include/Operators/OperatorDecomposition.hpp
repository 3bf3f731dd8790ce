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

#ifndef DFE_CORE_INCLUDE_OPERATORS_OPERATORDECOMPOSITION_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_OPERATORDECOMPOSITION_HPP_

#include <Operators/LogicalOperator.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace DFE {

using OperatorIdGenerator = std::function<OperatorId()>;

/**
 * @brief Expands derived operators into simpler operators with the same semantics.
 *
 * The expansion of an operator is a list of new operators in topological order.
 * The first operators consume the inputs of the expanded operator and the last operator produces its output.
 * The output operator inherits the hints of the expanded operator.
 * Basic operators (INPUT, FLAT_MAP, UNION, REDUCE_STATE_BY_KEY) have no expansion.
 *
 * Expansions:
 * MAP, FILTER, ASSIGN_EVENT_TIME -> FLAT_MAP
 * SUM_BY_KEY, COUNT_BY_KEY -> REDUCE_BY_KEY
 * DISTINCT -> REDUCE_BY_KEY, MAP
 * REDUCE_BY_KEY -> REDUCE_STATE_BY_KEY
 * JOIN -> FLAT_MAP (left), FLAT_MAP (right), UNION, REDUCE_STATE_BY_KEY
 */
class OperatorDecomposition {
  public:
    /**
     * @brief Expands an operator.
     * @param logicalOperator the operator
     * @param nextId generates the ids of the new operators
     * @return the new operators, std::nullopt if the operator has no expansion
     */
    static std::optional<std::vector<LogicalOperatorPtr>> decompose(const LogicalOperatorPtr& logicalOperator,
                                                                    const OperatorIdGenerator& nextId);
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_OPERATORDECOMPOSITION_HPP_
