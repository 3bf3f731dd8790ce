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

#include <Sources/MemorySource.hpp>

namespace DFE::Sources {

MemorySource::MemorySource(std::vector<Windowing::WindowedElement> elements) : elements(std::move(elements)) {}

DataSourcePtr MemorySource::create(const std::vector<std::any>& values) {
    std::vector<Windowing::WindowedElement> elements;
    elements.reserve(values.size());
    for (const auto& value : values) {
        elements.emplace_back(value, 0);
    }
    return std::make_shared<MemorySource>(std::move(elements));
}

DataSourcePtr MemorySource::createTimestamped(const std::vector<std::pair<std::any, uint64_t>>& values) {
    std::vector<Windowing::WindowedElement> elements;
    elements.reserve(values.size());
    for (const auto& [value, timestamp] : values) {
        elements.emplace_back(value, timestamp);
    }
    return std::make_shared<MemorySource>(std::move(elements));
}

std::vector<Windowing::WindowedElement> MemorySource::read() { return elements; }

std::string MemorySource::toString() const { return "MemorySource(" + std::to_string(elements.size()) + " elements)"; }

}// namespace DFE::Sources
