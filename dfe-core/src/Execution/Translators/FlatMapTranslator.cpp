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

#include <Execution/Translators/FlatMapTranslator.hpp>

namespace DFE::Execution {

OperatorTranslatorPtr FlatMapTranslator::create() { return std::make_shared<FlatMapTranslator>(); }

DataSetPtr FlatMapTranslator::translate(const LogicalOperatorPtr& logicalOperator,
                                        const std::vector<DataSetPtr>& inputs,
                                        const ExecutionContextPtr&) {
    const auto& descriptor = logicalOperator->as<FlatMapDescriptor>();
    auto function = descriptor.function;
    auto eventTimeExtractor = descriptor.eventTimeExtractor;
    auto input = inputs.at(0);
    return DataSet::create(logicalOperator->getName(), [function, eventTimeExtractor, input]() {
        std::vector<Windowing::WindowedElement> output;
        for (const auto& element : input->compute()) {
            VectorCollector collector;
            function(element.getValue(), collector);
            auto timestamp = eventTimeExtractor ? (*eventTimeExtractor)(element.getValue()) : element.getTimestamp();
            for (auto& value : collector.release()) {
                output.emplace_back(std::move(value), timestamp, element.getWindows());
            }
        }
        return output;
    });
}

}// namespace DFE::Execution
