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

#ifndef DFE_CORE_INCLUDE_OPERATORS_OPERATORDESCRIPTORS_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_OPERATORDESCRIPTORS_HPP_

#include <Operators/UserFunctions.hpp>
#include <Sources/DataSource.hpp>
#include <State/StateSerde.hpp>
#include <cstdint>
#include <optional>
#include <typeindex>
#include <variant>

namespace DFE {

/**
 * @brief Reads the elements of a data source.
 */
struct InputDescriptor {
    Sources::DataSourcePtr source;
};

/**
 * @brief Emits zero or more values per input value.
 * If an event time extractor is set, the outputs carry the timestamp extracted from the input value.
 */
struct FlatMapDescriptor {
    FlatMapFunction function;
    std::optional<TimestampExtractor> eventTimeExtractor = std::nullopt;
};

/**
 * @brief Emits the elements of all inputs.
 */
struct UnionDescriptor {};

/**
 * @brief Folds the values of each key and window into an accumulator and flushes it when the window fires.
 */
struct ReduceStateByKeyDescriptor {
    KeyExtractor keyExtractor;
    ValueExtractor valueExtractor;
    AccumulatorFunctions accumulator;
    State::StateSerdePtr keySerde;
    State::StateSerdePtr accumulatorSerde;
};

struct MapDescriptor {
    MapFunction function;
};

struct FilterDescriptor {
    FilterPredicate predicate;
};

struct AssignEventTimeDescriptor {
    TimestampExtractor extractor;
};

/**
 * @brief Reduces the values of each key and window with a reduce function.
 */
struct ReduceByKeyDescriptor {
    KeyExtractor keyExtractor;
    ValueExtractor valueExtractor;
    ReduceFunction reducer;
    bool combinable;
    State::StateSerdePtr keySerde;
    State::StateSerdePtr valueSerde;
};

/**
 * @brief Sums the int64_t values of each key and window.
 */
struct SumByKeyDescriptor {
    KeyExtractor keyExtractor;
    std::function<int64_t(const std::any&)> valueExtractor;
    State::StateSerdePtr keySerde;
};

/**
 * @brief Counts the elements of each key and window.
 */
struct CountByKeyDescriptor {
    KeyExtractor keyExtractor;
    State::StateSerdePtr keySerde;
};

/**
 * @brief Emits every distinct value, as mapped by the mapper, once per window.
 */
struct DistinctDescriptor {
    MapFunction mapper;
    State::StateSerdePtr valueSerde;
};

enum class JoinType : uint8_t { INNER, LEFT, RIGHT, FULL };

/**
 * @brief Joins the elements of two inputs with equal keys within the same window.
 */
struct JoinDescriptor {
    JoinType type;
    KeyExtractor leftKeyExtractor;
    KeyExtractor rightKeyExtractor;
    JoinFunction function;
    std::type_index keyType;
    State::StateSerdePtr keySerde;
    State::StateSerdePtr leftSerde;
    State::StateSerdePtr rightSerde;
};

/**
 * @brief The kind specific part of a logical operator.
 * The alternatives follow the order of OperatorKind.
 */
using OperatorDescriptor = std::variant<InputDescriptor,
                                        FlatMapDescriptor,
                                        UnionDescriptor,
                                        ReduceStateByKeyDescriptor,
                                        MapDescriptor,
                                        FilterDescriptor,
                                        AssignEventTimeDescriptor,
                                        ReduceByKeyDescriptor,
                                        SumByKeyDescriptor,
                                        CountByKeyDescriptor,
                                        DistinctDescriptor,
                                        JoinDescriptor>;

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_OPERATORDESCRIPTORS_HPP_
