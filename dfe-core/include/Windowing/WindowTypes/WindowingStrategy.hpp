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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_WINDOWINGSTRATEGY_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_WINDOWINGSTRATEGY_HPP_

#include <Windowing/MergeSet.hpp>
#include <Windowing/Window.hpp>
#include <Windowing/WindowedElement.hpp>
#include <memory>
#include <string>
#include <vector>

namespace DFE::Windowing {

class WindowingStrategy;
using WindowingStrategyPtr = std::shared_ptr<WindowingStrategy>;

/**
 * @brief A windowing strategy assigns elements to windows.
 * Merging strategies, e.g., session windows, additionally decide which windows of a key have to be merged.
 */
class WindowingStrategy {
  public:
    virtual ~WindowingStrategy() = default;

    /**
     * @brief Assigns the element to zero or more windows.
     * For non-merging strategies the result only depends on the timestamp of the element.
     * @param element the element
     * @return the windows of the element in ascending order
     */
    [[nodiscard]] virtual std::vector<Window> assignWindows(const WindowedElement& element) const = 0;

    /**
     * @brief Indicates if windows of this strategy can be merged after assignment.
     * @return true for merging strategies
     */
    [[nodiscard]] virtual bool isMerging() const { return false; }

    /**
     * @brief Computes the merges for the given windows of a single key.
     * Only windows that collapse with at least one other window are part of a merge set.
     * @param windows the currently known windows of a key, without duplicates
     * @return the merge sets, empty for non-merging strategies
     */
    [[nodiscard]] virtual std::vector<MergeSet> mergeWindows(const std::vector<Window>& windows) const;

    [[nodiscard]] virtual std::string toString() const = 0;

    /**
     * @brief Returns the windows of an element under an optional windowing.
     * Without windowing the element keeps its windows, an element without windows belongs to the global window.
     * @param windowing the windowing of an operator, may be nullptr
     * @param element the element
     * @return the windows of the element
     */
    static std::vector<Window> assignOrInherit(const WindowingStrategyPtr& windowing, const WindowedElement& element);
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_WINDOWTYPES_WINDOWINGSTRATEGY_HPP_
