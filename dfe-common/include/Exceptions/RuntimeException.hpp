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

#ifndef DFE_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_
#define DFE_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_

#include <exception>
#include <source_location>
#include <string>

namespace DFE::Exceptions {

/**
 * @brief Base class of all exceptions raised by DFE.
 */
class RuntimeException : virtual public std::exception {

  protected:
    std::string errorMessage;
    std::source_location location;

  public:
    /**
     * @brief Construct a runtime error from a message and the location it was raised at.
     * The error is logged when it is created.
     * @param msg The error message
     * @param location The source location
     */
    explicit RuntimeException(std::string msg, std::source_location location = std::source_location::current());

    ~RuntimeException() noexcept override = default;

    /**
     * @brief Returns the error message
     * @return The error message
     */
    [[nodiscard]] const char* what() const noexcept override;

    /**
     * @brief Returns where the error was raised.
     */
    [[nodiscard]] const std::source_location& getSourceLocation() const noexcept { return location; }
};

}// namespace DFE::Exceptions

#endif// DFE_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_
