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

#ifndef DFE_CORE_INCLUDE_UTIL_ANYUTIL_HPP_
#define DFE_CORE_INCLUDE_UTIL_ANYUTIL_HPP_

#include <any>
#include <string>

namespace DFE::Util {

/**
 * @brief Renders a payload for log messages and failure reports.
 * Strings, booleans and arithmetic types are printed, key-value pairs recursively, all other types as their type name.
 * @param value the payload
 * @return printable representation
 */
std::string anyToString(const std::any& value);

}// namespace DFE::Util

#endif// DFE_CORE_INCLUDE_UTIL_ANYUTIL_HPP_
