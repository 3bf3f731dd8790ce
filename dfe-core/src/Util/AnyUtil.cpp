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

#include <Util/AnyUtil.hpp>
#include <Windowing/WindowedElement.hpp>
#include <cstdint>
#include <fmt/format.h>

namespace DFE::Util {

std::string anyToString(const std::any& value) {
    if (!value.has_value()) {
        return "<empty>";
    }
    if (const auto* s = std::any_cast<std::string>(&value)) {
        return *s;
    }
    if (const auto* c = std::any_cast<const char*>(&value)) {
        return *c;
    }
    if (const auto* i = std::any_cast<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* u = std::any_cast<uint64_t>(&value)) {
        return std::to_string(*u);
    }
    if (const auto* i = std::any_cast<int32_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::any_cast<double>(&value)) {
        return fmt::format("{}", *d);
    }
    if (const auto* b = std::any_cast<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* kv = std::any_cast<Windowing::KeyValue>(&value)) {
        return "(" + anyToString(kv->first) + ", " + anyToString(kv->second) + ")";
    }
    return fmt::format("<{}>", value.type().name());
}

}// namespace DFE::Util
