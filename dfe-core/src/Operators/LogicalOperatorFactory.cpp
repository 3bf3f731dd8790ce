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

#include <Operators/LogicalOperatorFactory.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE {

LogicalOperatorPtr LogicalOperatorFactory::createInputOperator(const std::string& name,
                                                               Sources::DataSourcePtr source,
                                                               OperatorHints hints,
                                                               OperatorId id) {
    DFE_ASSERT(source, "input operator " << name << " requires a source");
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{},
                                             InputDescriptor{std::move(source)},
                                             nullptr,
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createFlatMapOperator(const std::string& name,
                                                                 const LogicalOperatorPtr& input,
                                                                 FlatMapFunction function,
                                                                 std::optional<TimestampExtractor> eventTimeExtractor,
                                                                 OperatorHints hints,
                                                                 OperatorId id) {
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             FlatMapDescriptor{std::move(function), std::move(eventTimeExtractor)},
                                             nullptr,
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createUnionOperator(const std::string& name,
                                                               std::vector<LogicalOperatorPtr> inputs,
                                                               OperatorHints hints,
                                                               OperatorId id) {
    DFE_ASSERT(inputs.size() >= 2, "union " << name << " requires at least two inputs");
    return std::make_shared<LogicalOperator>(id, name, std::move(inputs), UnionDescriptor{}, nullptr, hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createReduceStateByKeyOperator(const std::string& name,
                                                                          const LogicalOperatorPtr& input,
                                                                          ReduceStateByKeyDescriptor descriptor,
                                                                          Windowing::WindowingStrategyPtr windowing,
                                                                          OperatorHints hints,
                                                                          OperatorId id) {
    DFE_ASSERT(descriptor.keySerde && descriptor.accumulatorSerde, "operator " << name << " requires serdes for its state");
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             std::move(descriptor),
                                             std::move(windowing),
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createMapOperator(const std::string& name,
                                                             const LogicalOperatorPtr& input,
                                                             MapFunction function,
                                                             OperatorHints hints,
                                                             OperatorId id) {
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             MapDescriptor{std::move(function)},
                                             nullptr,
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createFilterOperator(const std::string& name,
                                                                const LogicalOperatorPtr& input,
                                                                FilterPredicate predicate,
                                                                OperatorHints hints,
                                                                OperatorId id) {
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             FilterDescriptor{std::move(predicate)},
                                             nullptr,
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createAssignEventTimeOperator(const std::string& name,
                                                                         const LogicalOperatorPtr& input,
                                                                         TimestampExtractor extractor,
                                                                         OperatorHints hints,
                                                                         OperatorId id) {
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             AssignEventTimeDescriptor{std::move(extractor)},
                                             nullptr,
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createReduceByKeyOperator(const std::string& name,
                                                                     const LogicalOperatorPtr& input,
                                                                     ReduceByKeyDescriptor descriptor,
                                                                     Windowing::WindowingStrategyPtr windowing,
                                                                     OperatorHints hints,
                                                                     OperatorId id) {
    DFE_ASSERT(descriptor.keySerde && descriptor.valueSerde, "operator " << name << " requires serdes for keys and values");
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             std::move(descriptor),
                                             std::move(windowing),
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createSumByKeyOperator(const std::string& name,
                                                                  const LogicalOperatorPtr& input,
                                                                  SumByKeyDescriptor descriptor,
                                                                  Windowing::WindowingStrategyPtr windowing,
                                                                  OperatorHints hints,
                                                                  OperatorId id) {
    DFE_ASSERT(descriptor.keySerde, "operator " << name << " requires a key serde");
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             std::move(descriptor),
                                             std::move(windowing),
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createCountByKeyOperator(const std::string& name,
                                                                    const LogicalOperatorPtr& input,
                                                                    CountByKeyDescriptor descriptor,
                                                                    Windowing::WindowingStrategyPtr windowing,
                                                                    OperatorHints hints,
                                                                    OperatorId id) {
    DFE_ASSERT(descriptor.keySerde, "operator " << name << " requires a key serde");
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             std::move(descriptor),
                                             std::move(windowing),
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createDistinctOperator(const std::string& name,
                                                                  const LogicalOperatorPtr& input,
                                                                  DistinctDescriptor descriptor,
                                                                  Windowing::WindowingStrategyPtr windowing,
                                                                  OperatorHints hints,
                                                                  OperatorId id) {
    DFE_ASSERT(descriptor.valueSerde, "operator " << name << " requires a value serde");
    if (!descriptor.mapper) {
        descriptor.mapper = [](const std::any& value) {
            return value;
        };
    }
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{input},
                                             std::move(descriptor),
                                             std::move(windowing),
                                             hints);
}

LogicalOperatorPtr LogicalOperatorFactory::createJoinOperator(const std::string& name,
                                                              const LogicalOperatorPtr& left,
                                                              const LogicalOperatorPtr& right,
                                                              JoinDescriptor descriptor,
                                                              Windowing::WindowingStrategyPtr windowing,
                                                              OperatorHints hints,
                                                              OperatorId id) {
    DFE_ASSERT(descriptor.keySerde && descriptor.leftSerde && descriptor.rightSerde,
               "join " << name << " requires serdes for keys and both sides");
    return std::make_shared<LogicalOperator>(id,
                                             name,
                                             std::vector<LogicalOperatorPtr>{left, right},
                                             std::move(descriptor),
                                             std::move(windowing),
                                             hints);
}

}// namespace DFE
