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
#include <Windowing/WindowTypes/SessionWindowing.hpp>
#include <algorithm>
#include <optional>
#include <sstream>

namespace DFE::Windowing {

SessionWindowing::SessionWindowing(uint64_t gap) : gap(gap) { DFE_ASSERT(gap > 0, "the session gap has to be positive"); }

WindowingStrategyPtr SessionWindowing::of(uint64_t gap) { return std::make_shared<SessionWindowing>(gap); }

std::vector<Window> SessionWindowing::assignWindows(const WindowedElement& element) const {
    return {Window(element.getTimestamp(), element.getTimestamp() + gap)};
}

std::vector<MergeSet> SessionWindowing::mergeWindows(const std::vector<Window>& windows) const {
    auto sorted = windows;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    std::vector<MergeSet> merges;
    std::vector<Window> group;
    std::optional<Window> covering;
    auto closeGroup = [&]() {
        if (group.size() > 1) {
            merges.emplace_back(group, covering.value());
        }
        group.clear();
        covering.reset();
    };
    for (const auto& window : sorted) {
        if (covering.has_value() && !covering->intersects(window)) {
            closeGroup();
        }
        group.emplace_back(window);
        covering = covering.has_value() ? covering->cover(window) : window;
    }
    closeGroup();
    DFE_TRACE2("SessionWindowing: {} windows produce {} merges", sorted.size(), merges.size());
    return merges;
}

std::string SessionWindowing::toString() const {
    std::stringstream ss;
    ss << "SessionWindow: gap=" << gap;
    return ss.str();
}

}// namespace DFE::Windowing
