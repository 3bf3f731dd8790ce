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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_SESSIONWINDOWING_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_SESSIONWINDOWING_HPP_

#include <Windowing/WindowTypes/WindowingStrategy.hpp>

namespace DFE::Windowing {
/**
 * @brief A SessionWindow groups the elements of a key into sessions of activity.
 * Each element opens the provisional window [timestamp, timestamp + gap).
 * Windows of the same key that overlap or touch are merged into one session.
 */
class SessionWindowing : public WindowingStrategy {
  public:
    explicit SessionWindowing(uint64_t gap);

    /**
     * @brief Creates a new SessionWindowing strategy.
     * @param gap the inactivity gap in milliseconds that closes a session.
     * @return WindowingStrategyPtr
     */
    static WindowingStrategyPtr of(uint64_t gap);

    [[nodiscard]] std::vector<Window> assignWindows(const WindowedElement& element) const override;

    [[nodiscard]] bool isMerging() const override { return true; }

    [[nodiscard]] std::vector<MergeSet> mergeWindows(const std::vector<Window>& windows) const override;

    [[nodiscard]] uint64_t getGap() const { return gap; }

    [[nodiscard]] std::string toString() const override;

  private:
    const uint64_t gap;
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_SESSIONWINDOWING_HPP_
