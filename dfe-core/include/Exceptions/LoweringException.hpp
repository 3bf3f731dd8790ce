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

#ifndef DFE_CORE_INCLUDE_EXCEPTIONS_LOWERINGEXCEPTION_HPP_
#define DFE_CORE_INCLUDE_EXCEPTIONS_LOWERINGEXCEPTION_HPP_

#include <Exceptions/RuntimeException.hpp>
#include <string>

namespace DFE::Exceptions {

/**
 * @brief Raised when a flow graph cannot be lowered, e.g., because a decomposition does not terminate.
 */
class LoweringException : public RuntimeException {
  public:
    explicit LoweringException(const std::string& message,
                               const std::source_location location = std::source_location::current());
};

}// namespace DFE::Exceptions

#endif// DFE_CORE_INCLUDE_EXCEPTIONS_LOWERINGEXCEPTION_HPP_
