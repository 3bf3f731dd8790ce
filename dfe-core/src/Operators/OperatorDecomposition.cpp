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
#include <Operators/OperatorDecomposition.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/WindowedElement.hpp>

namespace DFE {

namespace {

/**
 * @brief Payload of the union that feeds the state of a decomposed join.
 */
struct JoinSideValue {
    bool left;
    std::any value;
};

std::vector<std::any> concat(const std::any& left, const std::any& right) {
    auto result = std::any_cast<const std::vector<std::any>&>(left);
    const auto& rightValues = std::any_cast<const std::vector<std::any>&>(right);
    result.insert(result.end(), rightValues.begin(), rightValues.end());
    return result;
}

int64_t sum(const std::vector<std::any>& values) {
    int64_t result = 0;
    for (const auto& value : values) {
        result += std::any_cast<int64_t>(value);
    }
    return result;
}

class DecompositionVisitor {
  public:
    DecompositionVisitor(const LogicalOperatorPtr& logicalOperator, const OperatorIdGenerator& nextId)
        : op(logicalOperator), nextId(nextId) {}

    using Result = std::optional<std::vector<LogicalOperatorPtr>>;

    Result operator()(const InputDescriptor&) const { return std::nullopt; }
    Result operator()(const FlatMapDescriptor&) const { return std::nullopt; }
    Result operator()(const UnionDescriptor&) const { return std::nullopt; }
    Result operator()(const ReduceStateByKeyDescriptor&) const { return std::nullopt; }

    Result operator()(const MapDescriptor& descriptor) const {
        auto function = descriptor.function;
        return std::vector{LogicalOperatorFactory::createFlatMapOperator(
            op->getName() + ".flatMap",
            input(),
            [function](const std::any& value, Collector& collector) {
                collector.collect(function(value));
            },
            std::nullopt,
            op->getHints(),
            nextId())};
    }

    Result operator()(const FilterDescriptor& descriptor) const {
        auto predicate = descriptor.predicate;
        return std::vector{LogicalOperatorFactory::createFlatMapOperator(
            op->getName() + ".flatMap",
            input(),
            [predicate](const std::any& value, Collector& collector) {
                if (predicate(value)) {
                    collector.collect(value);
                }
            },
            std::nullopt,
            op->getHints(),
            nextId())};
    }

    Result operator()(const AssignEventTimeDescriptor& descriptor) const {
        return std::vector{LogicalOperatorFactory::createFlatMapOperator(
            op->getName() + ".flatMap",
            input(),
            [](const std::any& value, Collector& collector) {
                collector.collect(value);
            },
            descriptor.extractor,
            op->getHints(),
            nextId())};
    }

    Result operator()(const ReduceByKeyDescriptor& descriptor) const {
        auto reducer = descriptor.reducer;
        ReduceStateByKeyDescriptor state;
        state.keyExtractor = descriptor.keyExtractor;
        state.valueExtractor = descriptor.valueExtractor;
        state.keySerde = descriptor.keySerde;
        if (descriptor.combinable) {
            // the accumulator holds the partial result, it is empty until the first value arrives
            state.accumulatorSerde = State::OptionalSerde::create(descriptor.valueSerde);
            state.accumulator.create = []() {
                return std::any();
            };
            state.accumulator.add = [reducer](const std::any& accumulator, const std::any& value) {
                return accumulator.has_value() ? reducer({accumulator, value}) : value;
            };
            state.accumulator.combine = [reducer](const std::any& left, const std::any& right) {
                if (!left.has_value()) {
                    return right;
                }
                if (!right.has_value()) {
                    return left;
                }
                return reducer({left, right});
            };
            state.accumulator.flush = [](const std::any&, const std::any& accumulator, Collector& collector) {
                if (accumulator.has_value()) {
                    collector.collect(accumulator);
                }
            };
        } else {
            // the accumulator buffers all values, the reducer sees them when the window fires
            state.accumulatorSerde = State::ListSerde::create(descriptor.valueSerde);
            state.accumulator.create = []() {
                return std::any(std::vector<std::any>());
            };
            state.accumulator.add = [](const std::any& accumulator, const std::any& value) {
                auto values = std::any_cast<const std::vector<std::any>&>(accumulator);
                values.emplace_back(value);
                return std::any(std::move(values));
            };
            state.accumulator.combine = [](const std::any& left, const std::any& right) {
                return std::any(concat(left, right));
            };
            state.accumulator.flush = [reducer](const std::any&, const std::any& accumulator, Collector& collector) {
                const auto& values = std::any_cast<const std::vector<std::any>&>(accumulator);
                if (!values.empty()) {
                    collector.collect(reducer(values));
                }
            };
        }
        return std::vector{LogicalOperatorFactory::createReduceStateByKeyOperator(op->getName() + ".stateByKey",
                                                                                  input(),
                                                                                  std::move(state),
                                                                                  op->getWindowing(),
                                                                                  op->getHints(),
                                                                                  nextId())};
    }

    Result operator()(const SumByKeyDescriptor& descriptor) const {
        auto valueExtractor = descriptor.valueExtractor;
        ReduceByKeyDescriptor reduce{descriptor.keyExtractor,
                                     [valueExtractor](const std::any& value) {
                                         return std::any(valueExtractor(value));
                                     },
                                     [](const std::vector<std::any>& values) {
                                         return std::any(sum(values));
                                     },
                                     true,
                                     descriptor.keySerde,
                                     State::Int64Serde::create()};
        return std::vector{LogicalOperatorFactory::createReduceByKeyOperator(op->getName() + ".reduceByKey",
                                                                             input(),
                                                                             std::move(reduce),
                                                                             op->getWindowing(),
                                                                             op->getHints(),
                                                                             nextId())};
    }

    Result operator()(const CountByKeyDescriptor& descriptor) const {
        ReduceByKeyDescriptor reduce{descriptor.keyExtractor,
                                     [](const std::any&) {
                                         return std::any(int64_t(1));
                                     },
                                     [](const std::vector<std::any>& values) {
                                         return std::any(sum(values));
                                     },
                                     true,
                                     descriptor.keySerde,
                                     State::Int64Serde::create()};
        return std::vector{LogicalOperatorFactory::createReduceByKeyOperator(op->getName() + ".reduceByKey",
                                                                             input(),
                                                                             std::move(reduce),
                                                                             op->getWindowing(),
                                                                             op->getHints(),
                                                                             nextId())};
    }

    Result operator()(const DistinctDescriptor& descriptor) const {
        // the distinct values become keys, only the first of their (ignored) values is kept
        ReduceByKeyDescriptor reduce{descriptor.mapper,
                                     [](const std::any&) {
                                         return std::any(int64_t(0));
                                     },
                                     [](const std::vector<std::any>& values) {
                                         return values.front();
                                     },
                                     true,
                                     descriptor.valueSerde,
                                     State::Int64Serde::create()};
        auto reduceOperator = LogicalOperatorFactory::createReduceByKeyOperator(op->getName() + ".reduceByKey",
                                                                                input(),
                                                                                std::move(reduce),
                                                                                op->getWindowing(),
                                                                                OperatorHints::none(),
                                                                                nextId());
        auto keyOperator = LogicalOperatorFactory::createMapOperator(
            op->getName() + ".key",
            reduceOperator,
            [](const std::any& value) {
                return std::any_cast<const Windowing::KeyValue&>(value).first;
            },
            op->getHints(),
            nextId());
        return std::vector{reduceOperator, keyOperator};
    }

    Result operator()(const JoinDescriptor& descriptor) const {
        auto left = LogicalOperatorFactory::createFlatMapOperator(
            op->getName() + ".left",
            op->getInputs().at(0),
            [](const std::any& value, Collector& collector) {
                collector.collect(JoinSideValue{true, value});
            },
            std::nullopt,
            OperatorHints::none(),
            nextId());
        auto right = LogicalOperatorFactory::createFlatMapOperator(
            op->getName() + ".right",
            op->getInputs().at(1),
            [](const std::any& value, Collector& collector) {
                collector.collect(JoinSideValue{false, value});
            },
            std::nullopt,
            OperatorHints::none(),
            nextId());
        auto both = LogicalOperatorFactory::createUnionOperator(op->getName() + ".union",
                                                                {left, right},
                                                                OperatorHints::none(),
                                                                nextId());

        auto leftKey = descriptor.leftKeyExtractor;
        auto rightKey = descriptor.rightKeyExtractor;
        auto function = descriptor.function;
        auto type = descriptor.type;
        ReduceStateByKeyDescriptor state;
        state.keyExtractor = [leftKey, rightKey](const std::any& value) {
            const auto& sideValue = std::any_cast<const JoinSideValue&>(value);
            return sideValue.left ? leftKey(sideValue.value) : rightKey(sideValue.value);
        };
        state.valueExtractor = [](const std::any& value) {
            return value;
        };
        state.keySerde = descriptor.keySerde;
        state.accumulatorSerde = State::PairSerde::create(State::ListSerde::create(descriptor.leftSerde),
                                                          State::ListSerde::create(descriptor.rightSerde));
        // the accumulator holds the buffered left and right values of a key
        state.accumulator.create = []() {
            return std::any(Windowing::KeyValue(std::vector<std::any>(), std::vector<std::any>()));
        };
        state.accumulator.add = [](const std::any& accumulator, const std::any& value) {
            auto buffers = std::any_cast<const Windowing::KeyValue&>(accumulator);
            const auto& sideValue = std::any_cast<const JoinSideValue&>(value);
            auto& side = sideValue.left ? buffers.first : buffers.second;
            std::any_cast<std::vector<std::any>&>(side).emplace_back(sideValue.value);
            return std::any(std::move(buffers));
        };
        state.accumulator.combine = [](const std::any& left, const std::any& right) {
            const auto& leftBuffers = std::any_cast<const Windowing::KeyValue&>(left);
            const auto& rightBuffers = std::any_cast<const Windowing::KeyValue&>(right);
            return std::any(Windowing::KeyValue(concat(leftBuffers.first, rightBuffers.first),
                                                concat(leftBuffers.second, rightBuffers.second)));
        };
        state.accumulator.flush = [function, type](const std::any&, const std::any& accumulator, Collector& collector) {
            const auto& buffers = std::any_cast<const Windowing::KeyValue&>(accumulator);
            const auto& leftValues = std::any_cast<const std::vector<std::any>&>(buffers.first);
            const auto& rightValues = std::any_cast<const std::vector<std::any>&>(buffers.second);
            for (const auto& leftValue : leftValues) {
                for (const auto& rightValue : rightValues) {
                    function(leftValue, rightValue, collector);
                }
            }
            if (rightValues.empty() && (type == JoinType::LEFT || type == JoinType::FULL)) {
                for (const auto& leftValue : leftValues) {
                    function(leftValue, std::any(), collector);
                }
            }
            if (leftValues.empty() && (type == JoinType::RIGHT || type == JoinType::FULL)) {
                for (const auto& rightValue : rightValues) {
                    function(std::any(), rightValue, collector);
                }
            }
        };
        auto join = LogicalOperatorFactory::createReduceStateByKeyOperator(op->getName() + ".stateByKey",
                                                                           both,
                                                                           std::move(state),
                                                                           op->getWindowing(),
                                                                           op->getHints(),
                                                                           nextId());
        return std::vector{left, right, both, join};
    }

  private:
    [[nodiscard]] const LogicalOperatorPtr& input() const { return op->getInputs().at(0); }

    const LogicalOperatorPtr& op;
    const OperatorIdGenerator& nextId;
};

}// namespace

std::optional<std::vector<LogicalOperatorPtr>> OperatorDecomposition::decompose(const LogicalOperatorPtr& logicalOperator,
                                                                               const OperatorIdGenerator& nextId) {
    auto result = std::visit(DecompositionVisitor(logicalOperator, nextId), logicalOperator->getDescriptor());
    if (result) {
        DFE_DEBUG("OperatorDecomposition: expand " << logicalOperator->toString() << " into " << result->size() << " operators");
    }
    return result;
}

}// namespace DFE
