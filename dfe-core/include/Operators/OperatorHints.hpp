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

#ifndef DFE_CORE_INCLUDE_OPERATORS_OPERATORHINTS_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_OPERATORHINTS_HPP_

#include <cstdint>
#include <optional>

namespace DFE {

/**
 * @brief Hints the user attaches to an operator.
 * expensive marks operators whose output should be materialized once when more than one operator consumes it.
 * estimatedOutputSize is the expected number of output elements, used to choose broadcast joins.
 */
struct OperatorHints {
    bool expensive = false;
    std::optional<uint64_t> estimatedOutputSize = std::nullopt;

    static OperatorHints none() { return {}; }

    static OperatorHints expensiveOperator() { return {true, std::nullopt}; }

    static OperatorHints withSize(uint64_t estimatedOutputSize) { return {false, estimatedOutputSize}; }
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_OPERATORHINTS_HPP_
