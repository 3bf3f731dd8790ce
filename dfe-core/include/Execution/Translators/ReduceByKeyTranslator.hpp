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

#ifndef DFE_CORE_INCLUDE_EXECUTION_TRANSLATORS_REDUCEBYKEYTRANSLATOR_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_TRANSLATORS_REDUCEBYKEYTRANSLATOR_HPP_

#include <Execution/OperatorTranslator.hpp>

namespace DFE::Execution {

/**
 * @brief Evaluates a REDUCE_BY_KEY operator with a combinable reducer as hash aggregation.
 * The bounded input is reduced eagerly per (window, key), results are emitted in window order and key order.
 */
class ReduceByKeyTranslator : public OperatorTranslator {
  public:
    static OperatorTranslatorPtr create();

    DataSetPtr translate(const LogicalOperatorPtr& logicalOperator,
                         const std::vector<DataSetPtr>& inputs,
                         const ExecutionContextPtr& context) override;
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_TRANSLATORS_REDUCEBYKEYTRANSLATOR_HPP_
