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

#ifndef DFE_CORE_INCLUDE_OPERATORS_LOGICALOPERATORFACTORY_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_LOGICALOPERATORFACTORY_HPP_

#include <Operators/LogicalOperator.hpp>

namespace DFE {

/**
 * @brief Creates logical operators.
 * If no id is given, the operator receives the next free operator id of the process.
 */
class LogicalOperatorFactory {
  public:
    static LogicalOperatorPtr createInputOperator(const std::string& name,
                                                  Sources::DataSourcePtr source,
                                                  OperatorHints hints = OperatorHints::none(),
                                                  OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createFlatMapOperator(const std::string& name,
                                                    const LogicalOperatorPtr& input,
                                                    FlatMapFunction function,
                                                    std::optional<TimestampExtractor> eventTimeExtractor = std::nullopt,
                                                    OperatorHints hints = OperatorHints::none(),
                                                    OperatorId id = getNextOperatorId());

    /**
     * @brief Creates a union of at least two inputs.
     */
    static LogicalOperatorPtr createUnionOperator(const std::string& name,
                                                  std::vector<LogicalOperatorPtr> inputs,
                                                  OperatorHints hints = OperatorHints::none(),
                                                  OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createReduceStateByKeyOperator(const std::string& name,
                                                             const LogicalOperatorPtr& input,
                                                             ReduceStateByKeyDescriptor descriptor,
                                                             Windowing::WindowingStrategyPtr windowing = nullptr,
                                                             OperatorHints hints = OperatorHints::none(),
                                                             OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createMapOperator(const std::string& name,
                                                const LogicalOperatorPtr& input,
                                                MapFunction function,
                                                OperatorHints hints = OperatorHints::none(),
                                                OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createFilterOperator(const std::string& name,
                                                   const LogicalOperatorPtr& input,
                                                   FilterPredicate predicate,
                                                   OperatorHints hints = OperatorHints::none(),
                                                   OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createAssignEventTimeOperator(const std::string& name,
                                                            const LogicalOperatorPtr& input,
                                                            TimestampExtractor extractor,
                                                            OperatorHints hints = OperatorHints::none(),
                                                            OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createReduceByKeyOperator(const std::string& name,
                                                       const LogicalOperatorPtr& input,
                                                       ReduceByKeyDescriptor descriptor,
                                                       Windowing::WindowingStrategyPtr windowing = nullptr,
                                                       OperatorHints hints = OperatorHints::none(),
                                                       OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createSumByKeyOperator(const std::string& name,
                                                    const LogicalOperatorPtr& input,
                                                    SumByKeyDescriptor descriptor,
                                                    Windowing::WindowingStrategyPtr windowing = nullptr,
                                                    OperatorHints hints = OperatorHints::none(),
                                                    OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createCountByKeyOperator(const std::string& name,
                                                      const LogicalOperatorPtr& input,
                                                      CountByKeyDescriptor descriptor,
                                                      Windowing::WindowingStrategyPtr windowing = nullptr,
                                                      OperatorHints hints = OperatorHints::none(),
                                                      OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createDistinctOperator(const std::string& name,
                                                    const LogicalOperatorPtr& input,
                                                    DistinctDescriptor descriptor,
                                                    Windowing::WindowingStrategyPtr windowing = nullptr,
                                                    OperatorHints hints = OperatorHints::none(),
                                                    OperatorId id = getNextOperatorId());

    static LogicalOperatorPtr createJoinOperator(const std::string& name,
                                                const LogicalOperatorPtr& left,
                                                const LogicalOperatorPtr& right,
                                                JoinDescriptor descriptor,
                                                Windowing::WindowingStrategyPtr windowing = nullptr,
                                                OperatorHints hints = OperatorHints::none(),
                                                OperatorId id = getNextOperatorId());
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_LOGICALOPERATORFACTORY_HPP_
