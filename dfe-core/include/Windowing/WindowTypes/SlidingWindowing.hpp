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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_SLIDINGWINDOWING_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_SLIDINGWINDOWING_HPP_

#include <Windowing/WindowTypes/WindowingStrategy.hpp>

namespace DFE::Windowing {
/**
 * @brief A SlidingWindow assigns records to multiple overlapping windows.
 * A new window of the given size starts every slide milliseconds.
 */
class SlidingWindowing : public WindowingStrategy {
  public:
    SlidingWindowing(uint64_t size, uint64_t slide);

    /**
     * @brief Creates a new SlidingWindowing strategy.
     * @param size the size of each window in milliseconds.
     * @param slide the distance between the starts of two windows in milliseconds.
     * @return WindowingStrategyPtr
     */
    static WindowingStrategyPtr of(uint64_t size, uint64_t slide);

    [[nodiscard]] std::vector<Window> assignWindows(const WindowedElement& element) const override;

    [[nodiscard]] uint64_t getSize() const { return size; }

    [[nodiscard]] uint64_t getSlide() const { return slide; }

    [[nodiscard]] std::string toString() const override;

  private:
    const uint64_t size;
    const uint64_t slide;
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_SLIDINGWINDOWING_HPP_
