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

#include <Windowing/WindowTypes/WindowingStrategy.hpp>
#include <sstream>

namespace DFE::Windowing {

std::vector<MergeSet> WindowingStrategy::mergeWindows(const std::vector<Window>&) const { return {}; }

std::vector<Window> WindowingStrategy::assignOrInherit(const WindowingStrategyPtr& windowing, const WindowedElement& element) {
    if (windowing) {
        return windowing->assignWindows(element);
    }
    if (!element.getWindows().empty()) {
        return element.getWindows();
    }
    return {Window::global()};
}

std::string MergeSet::toString() const {
    std::stringstream ss;
    ss << "MergeSet(";
    for (const auto& source : sources) {
        ss << source << " ";
    }
    ss << "-> " << mergedWindow << ")";
    return ss.str();
}

}// namespace DFE::Windowing
