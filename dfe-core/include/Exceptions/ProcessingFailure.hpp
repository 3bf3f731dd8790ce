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

#ifndef DFE_CORE_INCLUDE_EXCEPTIONS_PROCESSINGFAILURE_HPP_
#define DFE_CORE_INCLUDE_EXCEPTIONS_PROCESSINGFAILURE_HPP_

#include <Windowing/Window.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace DFE::Exceptions {

enum class FailureKind : uint8_t { MERGE_CONSISTENCY, STATE_CORRUPTION, SPILL_IO };

/**
 * @brief Report of a failure that was contained while executing an operator.
 * Contained failures do not abort the execution, they are collected into the execution report.
 */
struct ProcessingFailure {
    FailureKind kind;
    std::string operatorName;
    // printable key, empty if the failure is not bound to a key
    std::string key;
    std::optional<Windowing::Window> window;
    std::string message;

    [[nodiscard]] std::string toString() const;
};

using FailureListener = std::function<void(const ProcessingFailure& failure)>;

}// namespace DFE::Exceptions

#endif// DFE_CORE_INCLUDE_EXCEPTIONS_PROCESSINGFAILURE_HPP_
