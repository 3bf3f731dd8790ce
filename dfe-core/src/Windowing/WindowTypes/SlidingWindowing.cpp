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
#include <Windowing/WindowTypes/SlidingWindowing.hpp>
#include <algorithm>
#include <sstream>

namespace DFE::Windowing {

SlidingWindowing::SlidingWindowing(uint64_t size, uint64_t slide) : size(size), slide(slide) {
    DFE_ASSERT(size > 0 && slide > 0, "size and slide of a sliding window have to be positive");
}

WindowingStrategyPtr SlidingWindowing::of(uint64_t size, uint64_t slide) {
    return std::make_shared<SlidingWindowing>(size, slide);
}

std::vector<Window> SlidingWindowing::assignWindows(const WindowedElement& element) const {
    auto timestamp = element.getTimestamp();
    auto lastStart = timestamp - (timestamp % slide);
    std::vector<Window> windows;
    // walk backwards from the latest window that starts before the timestamp
    for (auto windowStart = lastStart; windowStart + size > timestamp; windowStart -= slide) {
        windows.emplace_back(windowStart, windowStart + size);
        if (windowStart < slide) {
            break;
        }
    }
    std::reverse(windows.begin(), windows.end());
    DFE_TRACE2("SlidingWindowing: timestamp {} belongs to {} windows", timestamp, windows.size());
    return windows;
}

std::string SlidingWindowing::toString() const {
    std::stringstream ss;
    ss << "SlidingWindow: size=" << size;
    ss << " slide=" << slide;
    return ss.str();
}

}// namespace DFE::Windowing
