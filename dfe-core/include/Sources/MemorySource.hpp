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

#ifndef DFE_CORE_INCLUDE_SOURCES_MEMORYSOURCE_HPP_
#define DFE_CORE_INCLUDE_SOURCES_MEMORYSOURCE_HPP_

#include <Sources/DataSource.hpp>
#include <any>
#include <utility>

namespace DFE::Sources {

/**
 * @brief Source that replays elements held in memory.
 */
class MemorySource : public DataSource {
  public:
    explicit MemorySource(std::vector<Windowing::WindowedElement> elements);

    /**
     * @brief Creates a source whose elements all have timestamp 0.
     */
    static DataSourcePtr create(const std::vector<std::any>& values);

    /**
     * @brief Creates a source of (value, event timestamp) pairs.
     */
    static DataSourcePtr createTimestamped(const std::vector<std::pair<std::any, uint64_t>>& values);

    std::vector<Windowing::WindowedElement> read() override;

    [[nodiscard]] std::optional<uint64_t> getSizeEstimate() const override { return elements.size(); }

    [[nodiscard]] std::string toString() const override;

  private:
    std::vector<Windowing::WindowedElement> elements;
};

}// namespace DFE::Sources

#endif// DFE_CORE_INCLUDE_SOURCES_MEMORYSOURCE_HPP_
