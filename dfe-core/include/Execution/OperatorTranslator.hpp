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

#ifndef DFE_CORE_INCLUDE_EXECUTION_OPERATORTRANSLATOR_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_OPERATORTRANSLATOR_HPP_

#include <Execution/DataSet.hpp>
#include <Execution/ExecutionContext.hpp>
#include <Operators/LogicalOperator.hpp>
#include <memory>
#include <vector>

namespace DFE::Execution {

class OperatorTranslator;
using OperatorTranslatorPtr = std::shared_ptr<OperatorTranslator>;

/**
 * @brief Turns an accepted operator into the data set that computes its output.
 */
class OperatorTranslator {
  public:
    virtual ~OperatorTranslator() = default;

    /**
     * @brief Translates an operator.
     * @param logicalOperator the operator
     * @param inputs the data sets of the operator inputs, in input order
     * @param context the execution context
     * @return lazily computed output of the operator
     */
    virtual DataSetPtr
    translate(const LogicalOperatorPtr& logicalOperator, const std::vector<DataSetPtr>& inputs, const ExecutionContextPtr& context) = 0;
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_OPERATORTRANSLATOR_HPP_
