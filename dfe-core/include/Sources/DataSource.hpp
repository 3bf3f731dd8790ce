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

#ifndef DFE_CORE_INCLUDE_SOURCES_DATASOURCE_HPP_
#define DFE_CORE_INCLUDE_SOURCES_DATASOURCE_HPP_

#include <Windowing/WindowedElement.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DFE::Sources {

class DataSource;
using DataSourcePtr = std::shared_ptr<DataSource>;

/**
 * @brief A bounded source of elements. Physical I/O is implemented by backends.
 */
class DataSource {
  public:
    virtual ~DataSource() = default;

    /**
     * @brief Reads all elements of the source.
     * @return elements in source order
     */
    virtual std::vector<Windowing::WindowedElement> read() = 0;

    /**
     * @brief Returns the number of elements if it is known without reading the source.
     */
    [[nodiscard]] virtual std::optional<uint64_t> getSizeEstimate() const { return std::nullopt; }

    [[nodiscard]] virtual std::string toString() const = 0;
};

}// namespace DFE::Sources

#endif// DFE_CORE_INCLUDE_SOURCES_DATASOURCE_HPP_
