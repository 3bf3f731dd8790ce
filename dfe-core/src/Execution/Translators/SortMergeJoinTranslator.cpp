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

#include <Execution/Translators/SortMergeJoinTranslator.hpp>
#include <Util/Logger/Logger.hpp>
#include <algorithm>
#include <map>

namespace DFE::Execution {

namespace {

struct KeyedValue {
    std::any key;
    std::any value;
};

using KeyedValues = std::vector<KeyedValue>;

}// namespace

OperatorTranslatorPtr SortMergeJoinTranslator::create() { return std::make_shared<SortMergeJoinTranslator>(); }

DataSetPtr SortMergeJoinTranslator::translate(const LogicalOperatorPtr& logicalOperator,
                                              const std::vector<DataSetPtr>& inputs,
                                              const ExecutionContextPtr& context) {
    auto comparator = context->getComparators()->getComparator(logicalOperator->as<JoinDescriptor>().keyType);
    auto leftInput = inputs.at(0);
    auto rightInput = inputs.at(1);

    return DataSet::create(logicalOperator->getName(), [logicalOperator, comparator, leftInput, rightInput]() {
        const auto& descriptor = logicalOperator->as<JoinDescriptor>();
        const auto& windowing = logicalOperator->getWindowing();

        std::map<Windowing::Window, std::pair<KeyedValues, KeyedValues>> sidesOfWindow;
        for (const auto& element : leftInput->compute()) {
            auto key = descriptor.leftKeyExtractor(element.getValue());
            for (const auto& window : Windowing::WindowingStrategy::assignOrInherit(windowing, element)) {
                sidesOfWindow[window].first.emplace_back(KeyedValue{key, element.getValue()});
            }
        }
        for (const auto& element : rightInput->compute()) {
            auto key = descriptor.rightKeyExtractor(element.getValue());
            for (const auto& window : Windowing::WindowingStrategy::assignOrInherit(windowing, element)) {
                sidesOfWindow[window].second.emplace_back(KeyedValue{key, element.getValue()});
            }
        }

        auto less = [&comparator](const KeyedValue& left, const KeyedValue& right) {
            return comparator(left.key, right.key);
        };
        // returns the end of the run of equal keys that starts at begin
        auto endOfRun = [&less](const KeyedValues& values, size_t begin) {
            auto end = begin + 1;
            while (end < values.size() && !less(values[begin], values[end])) {
                ++end;
            }
            return end;
        };
        bool emitUnmatchedLeft = descriptor.type == JoinType::LEFT || descriptor.type == JoinType::FULL;
        bool emitUnmatchedRight = descriptor.type == JoinType::RIGHT || descriptor.type == JoinType::FULL;

        std::vector<Windowing::WindowedElement> output;
        for (auto& entry : sidesOfWindow) {
            const auto& window = entry.first;
            auto& left = entry.second.first;
            auto& right = entry.second.second;
            std::stable_sort(left.begin(), left.end(), less);
            std::stable_sort(right.begin(), right.end(), less);

            VectorCollector collector;
            auto emit = [&collector, &output, &window](const std::any& key) {
                for (auto& value : collector.release()) {
                    output.emplace_back(Windowing::KeyValue(key, std::move(value)),
                                        window.maxTimestamp(),
                                        std::vector<Windowing::Window>{window});
                }
            };

            size_t i = 0;
            size_t j = 0;
            while (i < left.size() || j < right.size()) {
                if (j == right.size() || (i < left.size() && less(left[i], right[j]))) {
                    auto end = endOfRun(left, i);
                    if (emitUnmatchedLeft) {
                        for (; i < end; ++i) {
                            descriptor.function(left[i].value, std::any(), collector);
                            emit(left[i].key);
                        }
                    }
                    i = end;
                } else if (i == left.size() || less(right[j], left[i])) {
                    auto end = endOfRun(right, j);
                    if (emitUnmatchedRight) {
                        for (; j < end; ++j) {
                            descriptor.function(std::any(), right[j].value, collector);
                            emit(right[j].key);
                        }
                    }
                    j = end;
                } else {
                    auto leftEnd = endOfRun(left, i);
                    auto rightEnd = endOfRun(right, j);
                    for (auto l = i; l < leftEnd; ++l) {
                        for (auto r = j; r < rightEnd; ++r) {
                            descriptor.function(left[l].value, right[r].value, collector);
                        }
                    }
                    emit(left[i].key);
                    i = leftEnd;
                    j = rightEnd;
                }
            }
        }
        return output;
    });
}

}// namespace DFE::Execution
