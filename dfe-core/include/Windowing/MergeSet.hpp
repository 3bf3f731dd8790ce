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

#ifndef DFE_CORE_INCLUDE_WINDOWING_MERGESET_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_MERGESET_HPP_

#include <Windowing/Window.hpp>
#include <string>
#include <utility>
#include <vector>

namespace DFE::Windowing {

/**
 * @brief Describes that a set of source windows collapses into one merged window.
 * The merged window may itself be one of the sources.
 */
class MergeSet {
  public:
    MergeSet(std::vector<Window> sources, Window mergedWindow) : sources(std::move(sources)), mergedWindow(mergedWindow) {}

    [[nodiscard]] const std::vector<Window>& getSources() const { return sources; }

    [[nodiscard]] const Window& getMergedWindow() const { return mergedWindow; }

    [[nodiscard]] std::string toString() const;

  private:
    std::vector<Window> sources;
    Window mergedWindow;
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_MERGESET_HPP_
