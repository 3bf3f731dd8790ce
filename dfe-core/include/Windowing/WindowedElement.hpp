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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WINDOWEDELEMENT_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WINDOWEDELEMENT_HPP_

#include <Windowing/Window.hpp>
#include <any>
#include <cstdint>
#include <utility>
#include <vector>

namespace DFE::Windowing {

/**
 * @brief An element flowing through the dataflow.
 * It carries an opaque payload, its event timestamp and the windows it currently belongs to.
 * An element may belong to more than one window until a keyed operator resolves them.
 */
class WindowedElement {
  public:
    WindowedElement(std::any value, uint64_t timestamp) : value(std::move(value)), timestamp(timestamp) {}

    WindowedElement(std::any value, uint64_t timestamp, std::vector<Window> windows)
        : value(std::move(value)), timestamp(timestamp), windows(std::move(windows)) {}

    [[nodiscard]] const std::any& getValue() const { return value; }

    [[nodiscard]] uint64_t getTimestamp() const { return timestamp; }

    [[nodiscard]] const std::vector<Window>& getWindows() const { return windows; }

    void setTimestamp(uint64_t newTimestamp) { timestamp = newTimestamp; }

    void setWindows(std::vector<Window> newWindows) { windows = std::move(newWindows); }

  private:
    std::any value;
    uint64_t timestamp;
    std::vector<Window> windows;
};

/**
 * @brief Payload of keyed elements, e.g., the output of a keyed aggregation.
 */
using KeyValue = std::pair<std::any, std::any>;

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_WINDOWEDELEMENT_HPP_
