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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WINDOW_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WINDOW_HPP_

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace DFE::Windowing {

/**
 * @brief A window is the half open time interval [start, end).
 * Windows are ordered by start and then by end, which is the order in which they are fired.
 */
class Window {
  public:
    /**
     * @brief Creates the window [start, end).
     * @param start inclusive start timestamp
     * @param end exclusive end timestamp, has to be larger than start
     */
    Window(uint64_t start, uint64_t end);

    /**
     * @brief The global window covers all timestamps and is used for elements of unwindowed operators.
     * @return the window [0, UINT64_MAX)
     */
    static Window global();

    [[nodiscard]] uint64_t getStart() const { return start; }

    [[nodiscard]] uint64_t getEnd() const { return end; }

    /**
     * @brief The largest timestamp that still belongs to this window.
     * @return end - 1
     */
    [[nodiscard]] uint64_t maxTimestamp() const { return end - 1; }

    [[nodiscard]] bool contains(uint64_t timestamp) const { return start <= timestamp && timestamp < end; }

    /**
     * @brief Checks if both windows overlap or touch each other.
     * @param other window
     * @return true if the union of both windows is a single interval
     */
    [[nodiscard]] bool intersects(const Window& other) const;

    /**
     * @brief Returns the smallest window that contains this and the other window.
     * @param other window
     * @return covering window
     */
    [[nodiscard]] Window cover(const Window& other) const;

    [[nodiscard]] bool isGlobal() const;

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const Window& other) const = default;
    bool operator==(const Window& other) const = default;

  private:
    uint64_t start;
    uint64_t end;
};

std::ostream& operator<<(std::ostream& os, const Window& window);

}// namespace DFE::Windowing

namespace std {
template<>
struct hash<DFE::Windowing::Window> {
    size_t operator()(const DFE::Windowing::Window& window) const noexcept {
        auto h1 = std::hash<uint64_t>{}(window.getStart());
        auto h2 = std::hash<uint64_t>{}(window.getEnd());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
}// namespace std

#endif// DFE_CORE_INCLUDE_WINDOWING_WINDOW_HPP_
