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

#include <Util/Logger/Logger.hpp>
#include <Windowing/WindowTypes/TumblingWindowing.hpp>
#include <sstream>

namespace DFE::Windowing {

TumblingWindowing::TumblingWindowing(uint64_t size) : size(size) {
    DFE_ASSERT(size > 0, "the size of a tumbling window has to be positive");
}

WindowingStrategyPtr TumblingWindowing::of(uint64_t size) { return std::make_shared<TumblingWindowing>(size); }

std::vector<Window> TumblingWindowing::assignWindows(const WindowedElement& element) const {
    auto timestamp = element.getTimestamp();
    auto start = timestamp - (timestamp % size);
    return {Window(start, start + size)};
}

std::string TumblingWindowing::toString() const {
    std::stringstream ss;
    ss << "TumblingWindow: size=" << size;
    return ss.str();
}

}// namespace DFE::Windowing
