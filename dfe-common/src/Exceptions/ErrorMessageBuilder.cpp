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

#include <Exceptions/ErrorMessageBuilder.hpp>
#include <Exceptions/RuntimeException.hpp>
#include <fmt/format.h>

namespace DFE::Exceptions {

void failAssertion(std::string_view condition, const ErrorMessageBuilder& message, std::source_location location) {
    throw RuntimeException(fmt::format("assertion '{}' failed: {}", condition, message.str()), location);
}

void raiseRuntimeError(const ErrorMessageBuilder& message, std::source_location location) {
    throw RuntimeException(message.str(), location);
}

}// namespace DFE::Exceptions
