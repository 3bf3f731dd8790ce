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

#include <Execution/Translators/ReduceByKeyTranslator.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/Watermark/EventTimeWatermarkGenerator.hpp>
#include <algorithm>
#include <map>

namespace DFE::Execution {

OperatorTranslatorPtr ReduceByKeyTranslator::create() { return std::make_shared<ReduceByKeyTranslator>(); }

DataSetPtr ReduceByKeyTranslator::translate(const LogicalOperatorPtr& logicalOperator,
                                            const std::vector<DataSetPtr>& inputs,
                                            const ExecutionContextPtr& context) {
    DFE_ASSERT(logicalOperator->as<ReduceByKeyDescriptor>().combinable,
               "ReduceByKeyTranslator requires a combinable reducer, " << logicalOperator->getName() << " is not combinable");
    auto input = inputs.at(0);
    return DataSet::create(logicalOperator->getName(), [logicalOperator, input, context]() {
        const auto& descriptor = logicalOperator->as<ReduceByKeyDescriptor>();
        struct PartialResult {
            std::any key;
            std::any value;
        };
        std::map<Windowing::Window, std::map<std::string, PartialResult>> partialResults;
        std::vector<Windowing::WindowedElement> output;

        // emits all windows that end at or before the watermark
        auto fire = [&partialResults, &output](uint64_t watermark) {
            auto it = partialResults.begin();
            while (it != partialResults.end()) {
                if (it->first.getEnd() > watermark) {
                    ++it;
                    continue;
                }
                for (const auto& [keyBytes, result] : it->second) {
                    output.emplace_back(Windowing::KeyValue(result.key, result.value),
                                        it->first.maxTimestamp(),
                                        std::vector<Windowing::Window>{it->first});
                }
                it = partialResults.erase(it);
            }
        };

        Windowing::EventTimeWatermarkGenerator watermarkGenerator(context->getAllowedLateness(), context->getWatermarkFrequency());
        uint64_t lastWatermark = 0;
        ExecutionReport operatorReport;
        for (const auto& element : input->compute()) {
            auto windows = Windowing::WindowingStrategy::assignOrInherit(logicalOperator->getWindowing(), element);
            if (!windows.empty()) {
                std::erase_if(windows, [lastWatermark](const Windowing::Window& window) {
                    return window.getEnd() <= lastWatermark;
                });
                if (windows.empty()) {
                    ++operatorReport.droppedLateElements;
                    DFE_DEBUG2("ReduceByKeyTranslator {}: drop late element with timestamp {} at watermark {}",
                               logicalOperator->getName(),
                               element.getTimestamp(),
                               lastWatermark);
                }
            }

            auto key = descriptor.keyExtractor(element.getValue());
            auto keyBytes = descriptor.keySerde->serialize(key);
            auto value = descriptor.valueExtractor(element.getValue());
            for (const auto& window : windows) {
                auto& resultsOfWindow = partialResults[window];
                auto it = resultsOfWindow.find(keyBytes);
                if (it == resultsOfWindow.end()) {
                    resultsOfWindow.emplace(keyBytes, PartialResult{key, value});
                } else {
                    it->second.value = descriptor.reducer({it->second.value, value});
                }
            }

            if (auto watermark = watermarkGenerator.onElement(element.getTimestamp()); watermark && *watermark > lastWatermark) {
                lastWatermark = *watermark;
                fire(lastWatermark);
            }
        }
        fire(watermarkGenerator.onEndOfInput());

        context->getFailureCollector()->addOperatorReport(logicalOperator->getId(), operatorReport);
        return output;
    });
}

}// namespace DFE::Execution
