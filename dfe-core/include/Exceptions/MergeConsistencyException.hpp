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

#ifndef DFE_CORE_INCLUDE_EXCEPTIONS_MERGECONSISTENCYEXCEPTION_HPP_
#define DFE_CORE_INCLUDE_EXCEPTIONS_MERGECONSISTENCYEXCEPTION_HPP_

#include <Exceptions/RuntimeException.hpp>
#include <Windowing/Window.hpp>
#include <string>

namespace DFE::Exceptions {

/**
 * @brief Raised when a windowing strategy asks to merge a window that is neither tracked for the key nor
 * assigned to the current element. The key cannot be processed any further.
 */
class MergeConsistencyException : public RuntimeException {
  public:
    MergeConsistencyException(const std::string& key,
                              const Windowing::Window& window,
                              const std::source_location location = std::source_location::current());

    [[nodiscard]] const std::string& getKey() const { return key; }

    [[nodiscard]] const Windowing::Window& getWindow() const { return window; }

  private:
    std::string key;
    Windowing::Window window;
};

}// namespace DFE::Exceptions

#endif// DFE_CORE_INCLUDE_EXCEPTIONS_MERGECONSISTENCYEXCEPTION_HPP_
