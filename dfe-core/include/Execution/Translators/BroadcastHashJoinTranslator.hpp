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

#ifndef DFE_CORE_INCLUDE_EXECUTION_TRANSLATORS_BROADCASTHASHJOINTRANSLATOR_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_TRANSLATORS_BROADCASTHASHJOINTRANSLATOR_HPP_

#include <Execution/OperatorTranslator.hpp>
#include <optional>

namespace DFE::Execution {

enum class JoinSide : uint8_t { LEFT, RIGHT };

/**
 * @brief Joins a large input with a small input that is loaded into a hash table.
 * The small side has to be compatible with the join type: an outer side can not be broadcast.
 * The threshold only decides whether lowering accepts the join, translation broadcasts the smallest compatible side.
 * Results are emitted in the order of the probe side as KeyValue(key, joined value).
 */
class BroadcastHashJoinTranslator : public OperatorTranslator {
  public:
    static OperatorTranslatorPtr create();

    DataSetPtr translate(const LogicalOperatorPtr& logicalOperator,
                         const std::vector<DataSetPtr>& inputs,
                         const ExecutionContextPtr& context) override;

    /**
     * @brief Returns the estimated number of output elements of an operator.
     * The estimate is the size hint of the operator or, for INPUT operators, the size of the source.
     */
    static std::optional<uint64_t> estimateOutputSize(const LogicalOperator& logicalOperator);

    /**
     * @brief Chooses the side of a JOIN operator that is broadcast.
     * If both sides of an INNER join qualify, the smaller one is broadcast, the right one on a tie.
     * @param join the join operator
     * @param threshold maximal estimated size of the broadcast side
     * @return the side, std::nullopt if no side is small enough and compatible with the join type
     */
    static std::optional<JoinSide> selectBroadcastSide(const LogicalOperator& join, uint64_t threshold);
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_TRANSLATORS_BROADCASTHASHJOINTRANSLATOR_HPP_
