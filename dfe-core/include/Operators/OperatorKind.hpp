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

#ifndef DFE_CORE_INCLUDE_OPERATORS_OPERATORKIND_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_OPERATORKIND_HPP_

#include <cstdint>
#include <magic_enum.hpp>
#include <string>

namespace DFE {

/**
 * @brief Tag of a logical operator.
 * The order follows the alternatives of OperatorDescriptor.
 * INPUT, FLAT_MAP, UNION and REDUCE_STATE_BY_KEY are basic operators that have no decomposition.
 */
enum class OperatorKind : uint8_t {
    INPUT,
    FLAT_MAP,
    UNION,
    REDUCE_STATE_BY_KEY,
    MAP,
    FILTER,
    ASSIGN_EVENT_TIME,
    REDUCE_BY_KEY,
    SUM_BY_KEY,
    COUNT_BY_KEY,
    DISTINCT,
    JOIN
};

inline std::string toString(OperatorKind kind) { return std::string(magic_enum::enum_name(kind)); }

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_OPERATORKIND_HPP_
