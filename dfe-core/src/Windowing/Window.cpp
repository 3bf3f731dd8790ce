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
#include <Windowing/Window.hpp>
#include <algorithm>
#include <limits>
#include <sstream>

namespace DFE::Windowing {

Window::Window(uint64_t start, uint64_t end) : start(start), end(end) {
    DFE_ASSERT(start < end, "window start " << start << " has to be smaller than its end " << end);
}

Window Window::global() { return {0, std::numeric_limits<uint64_t>::max()}; }

bool Window::isGlobal() const { return start == 0 && end == std::numeric_limits<uint64_t>::max(); }

bool Window::intersects(const Window& other) const { return start <= other.end && other.start <= end; }

Window Window::cover(const Window& other) const { return {std::min(start, other.start), std::max(end, other.end)}; }

std::string Window::toString() const {
    std::stringstream ss;
    ss << "[" << start << ", " << end << ")";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Window& window) { return os << window.toString(); }

}// namespace DFE::Windowing
