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

#include <Exceptions/SpillIOException.hpp>
#include <Execution/Translators/ReduceStateByKeyTranslator.hpp>
#include <State/KeyedWindowStateStore.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/Runtime/KeyedWindowProcessor.hpp>
#include <Windowing/Watermark/EventTimeWatermarkGenerator.hpp>

namespace DFE::Execution {

OperatorTranslatorPtr ReduceStateByKeyTranslator::create() { return std::make_shared<ReduceStateByKeyTranslator>(); }

DataSetPtr ReduceStateByKeyTranslator::translate(const LogicalOperatorPtr& logicalOperator,
                                                 const std::vector<DataSetPtr>& inputs,
                                                 const ExecutionContextPtr& context) {
    auto input = inputs.at(0);
    return DataSet::create(logicalOperator->getName(), [logicalOperator, input, context]() {
        const auto& descriptor = logicalOperator->as<ReduceStateByKeyDescriptor>();
        auto store = State::KeyedWindowStateStore::create(State::StateDescriptor{descriptor.keySerde,
                                                                                 descriptor.accumulatorSerde,
                                                                                 descriptor.accumulator.create,
                                                                                 descriptor.accumulator.combine},
                                                          context->getStateCapacity(),
                                                          context->getSpillStorageFactory()->create());
        ExecutionReport operatorReport;
        Windowing::KeyedWindowProcessor processor(logicalOperator->getName(),
                                                  logicalOperator->getWindowing(),
                                                  descriptor.keyExtractor,
                                                  descriptor.valueExtractor,
                                                  descriptor.accumulator,
                                                  descriptor.keySerde,
                                                  store,
                                                  [&operatorReport](const Exceptions::ProcessingFailure& failure) {
                                                      operatorReport.failures.emplace_back(failure);
                                                  });
        Windowing::EventTimeWatermarkGenerator watermarkGenerator(context->getAllowedLateness(), context->getWatermarkFrequency());

        std::vector<Windowing::WindowedElement> output;
        auto emit = [&output](std::vector<Windowing::WindowedElement> fired) {
            output.insert(output.end(), std::make_move_iterator(fired.begin()), std::make_move_iterator(fired.end()));
        };
        try {
            for (const auto& element : input->compute()) {
                processor.onElement(element);
                if (auto watermark = watermarkGenerator.onElement(element.getTimestamp())) {
                    emit(processor.onWatermark(*watermark));
                }
            }
            emit(processor.onWatermark(watermarkGenerator.onEndOfInput()));
        } catch (const Exceptions::SpillIOException&) {
            operatorReport.droppedLateElements = processor.getNumberOfDroppedLateElements();
            context->getFailureCollector()->addOperatorReport(logicalOperator->getId(), operatorReport);
            throw;
        }

        operatorReport.droppedLateElements = processor.getNumberOfDroppedLateElements();
        context->getFailureCollector()->addOperatorReport(logicalOperator->getId(), operatorReport);
        DFE_DEBUG2("ReduceStateByKeyTranslator {}: {} spilled entries left, {} late elements dropped",
                   logicalOperator->getName(),
                   store->getNumberOfSpilledEntries(),
                   operatorReport.droppedLateElements);
        return output;
    });
}

}// namespace DFE::Execution
