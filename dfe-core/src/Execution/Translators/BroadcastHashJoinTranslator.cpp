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

#include <Execution/Translators/BroadcastHashJoinTranslator.hpp>
#include <Util/Logger/Logger.hpp>
#include <limits>
#include <map>
#include <utility>

namespace DFE::Execution {

OperatorTranslatorPtr BroadcastHashJoinTranslator::create() { return std::make_shared<BroadcastHashJoinTranslator>(); }

std::optional<uint64_t> BroadcastHashJoinTranslator::estimateOutputSize(const LogicalOperator& logicalOperator) {
    if (logicalOperator.getHints().estimatedOutputSize) {
        return logicalOperator.getHints().estimatedOutputSize;
    }
    if (logicalOperator.instanceOf<InputDescriptor>()) {
        return logicalOperator.as<InputDescriptor>().source->getSizeEstimate();
    }
    return std::nullopt;
}

std::optional<JoinSide> BroadcastHashJoinTranslator::selectBroadcastSide(const LogicalOperator& join, uint64_t threshold) {
    auto isSmall = [threshold](const LogicalOperatorPtr& input) {
        auto estimate = estimateOutputSize(*input);
        return estimate.has_value() && *estimate <= threshold;
    };
    bool leftSmall = isSmall(join.getInputs().at(0));
    bool rightSmall = isSmall(join.getInputs().at(1));
    switch (join.as<JoinDescriptor>().type) {
        case JoinType::INNER: {
            if (leftSmall && rightSmall) {
                auto leftSize = *estimateOutputSize(*join.getInputs().at(0));
                auto rightSize = *estimateOutputSize(*join.getInputs().at(1));
                return leftSize < rightSize ? JoinSide::LEFT : JoinSide::RIGHT;
            }
            if (rightSmall) {
                return JoinSide::RIGHT;
            }
            if (leftSmall) {
                return JoinSide::LEFT;
            }
            return std::nullopt;
        }
        case JoinType::LEFT: return rightSmall ? std::optional(JoinSide::RIGHT) : std::nullopt;
        case JoinType::RIGHT: return leftSmall ? std::optional(JoinSide::LEFT) : std::nullopt;
        case JoinType::FULL: return std::nullopt;
    }
    return std::nullopt;
}

DataSetPtr BroadcastHashJoinTranslator::translate(const LogicalOperatorPtr& logicalOperator,
                                                  const std::vector<DataSetPtr>& inputs,
                                                  const ExecutionContextPtr&) {
    // lowering accepted the join for a threshold, the smallest compatible side is at most that threshold
    auto side = selectBroadcastSide(*logicalOperator, std::numeric_limits<uint64_t>::max());
    if (!side) {
        throw Exceptions::RuntimeException("BroadcastHashJoinTranslator: no side of " + logicalOperator->getName()
                                           + " can be broadcast");
    }
    auto broadcastRight = *side == JoinSide::RIGHT;
    DFE_DEBUG("BroadcastHashJoinTranslator: broadcast the " << (broadcastRight ? "right" : "left") << " side of "
                                                            << logicalOperator->getName());
    auto buildInput = broadcastRight ? inputs.at(1) : inputs.at(0);
    auto probeInput = broadcastRight ? inputs.at(0) : inputs.at(1);

    return DataSet::create(logicalOperator->getName(), [logicalOperator, broadcastRight, buildInput, probeInput]() {
        const auto& descriptor = logicalOperator->as<JoinDescriptor>();
        const auto& buildKey = broadcastRight ? descriptor.rightKeyExtractor : descriptor.leftKeyExtractor;
        const auto& probeKey = broadcastRight ? descriptor.leftKeyExtractor : descriptor.rightKeyExtractor;
        // the probe side is an outer side if its unmatched elements are part of the result
        bool probeIsOuter = broadcastRight ? descriptor.type == JoinType::LEFT : descriptor.type == JoinType::RIGHT;

        std::map<std::pair<Windowing::Window, std::string>, std::vector<std::any>> hashTable;
        for (const auto& element : buildInput->compute()) {
            auto keyBytes = descriptor.keySerde->serialize(buildKey(element.getValue()));
            for (const auto& window : Windowing::WindowingStrategy::assignOrInherit(nullptr, element)) {
                hashTable[{window, keyBytes}].emplace_back(element.getValue());
            }
        }

        std::vector<Windowing::WindowedElement> output;
        for (const auto& element : probeInput->compute()) {
            const auto& probeValue = element.getValue();
            auto key = probeKey(probeValue);
            auto keyBytes = descriptor.keySerde->serialize(key);
            for (const auto& window : Windowing::WindowingStrategy::assignOrInherit(nullptr, element)) {
                VectorCollector collector;
                auto matches = hashTable.find({window, keyBytes});
                if (matches != hashTable.end()) {
                    for (const auto& buildValue : matches->second) {
                        if (broadcastRight) {
                            descriptor.function(probeValue, buildValue, collector);
                        } else {
                            descriptor.function(buildValue, probeValue, collector);
                        }
                    }
                } else if (probeIsOuter) {
                    if (broadcastRight) {
                        descriptor.function(probeValue, std::any(), collector);
                    } else {
                        descriptor.function(std::any(), probeValue, collector);
                    }
                }
                for (auto& value : collector.release()) {
                    output.emplace_back(Windowing::KeyValue(key, std::move(value)),
                                        window.maxTimestamp(),
                                        std::vector<Windowing::Window>{window});
                }
            }
        }
        return output;
    });
}

}// namespace DFE::Execution
