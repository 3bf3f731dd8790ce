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

#include <Execution/Translators/UnionTranslator.hpp>
#include <algorithm>

namespace DFE::Execution {

OperatorTranslatorPtr UnionTranslator::create() { return std::make_shared<UnionTranslator>(); }

DataSetPtr UnionTranslator::translate(const LogicalOperatorPtr& logicalOperator,
                                      const std::vector<DataSetPtr>& inputs,
                                      const ExecutionContextPtr&) {
    return DataSet::create(logicalOperator->getName(), [inputs]() {
        std::vector<Windowing::WindowedElement> output;
        for (const auto& input : inputs) {
            auto elements = input->compute();
            output.insert(output.end(), std::make_move_iterator(elements.begin()), std::make_move_iterator(elements.end()));
        }
        // keyed consumers derive watermarks from the event time, so the union must not go back in time
        std::stable_sort(output.begin(), output.end(), [](const auto& left, const auto& right) {
            return left.getTimestamp() < right.getTimestamp();
        });
        return output;
    });
}

}// namespace DFE::Execution
