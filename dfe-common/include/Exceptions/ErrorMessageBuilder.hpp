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

#ifndef DFE_COMMON_INCLUDE_EXCEPTIONS_ERRORMESSAGEBUILDER_HPP_
#define DFE_COMMON_INCLUDE_EXCEPTIONS_ERRORMESSAGEBUILDER_HPP_

#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace DFE::Exceptions {

/**
 * @brief Collects the streamed parts of an error message, used by DFE_ASSERT and DFE_THROW_RUNTIME_ERROR.
 */
class ErrorMessageBuilder {
  public:
    template<typename T>
    ErrorMessageBuilder& operator<<(const T& part) {
        stream << part;
        return *this;
    }

    [[nodiscard]] std::string str() const { return stream.str(); }

  private:
    std::ostringstream stream;
};

/**
 * @brief Throws a RuntimeException for a violated condition.
 * @param condition source text of the condition
 * @param message the streamed message of the assertion
 * @param location the location of the assertion
 */
[[noreturn]] void failAssertion(std::string_view condition,
                                const ErrorMessageBuilder& message,
                                std::source_location location = std::source_location::current());

/**
 * @brief Throws a RuntimeException with the streamed message.
 */
[[noreturn]] void raiseRuntimeError(const ErrorMessageBuilder& message,
                                    std::source_location location = std::source_location::current());

}// namespace DFE::Exceptions

#endif// DFE_COMMON_INCLUDE_EXCEPTIONS_ERRORMESSAGEBUILDER_HPP_
