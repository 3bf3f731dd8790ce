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

#ifndef DFE_CORE_INCLUDE_EXECUTION_DATASET_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_DATASET_HPP_

#include <Windowing/WindowedElement.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DFE::Execution {

class DataSet;
using DataSetPtr = std::shared_ptr<DataSet>;

/**
 * @brief A lazily computed sequence of elements.
 * Every call of compute runs the producer again, unless the data set is persisted.
 * A persisted data set runs its producer once and keeps the result for all consumers.
 */
class DataSet {
  public:
    using Producer = std::function<std::vector<Windowing::WindowedElement>()>;

    DataSet(std::string name, Producer producer);

    static DataSetPtr create(std::string name, Producer producer);

    /**
     * @brief Returns the elements of the data set.
     * If the producer throws, nothing is cached and the exception is propagated.
     */
    std::vector<Windowing::WindowedElement> compute();

    /**
     * @brief Keeps the result of the next computation for all following calls of compute.
     */
    void persist();

    [[nodiscard]] bool isPersisted() const { return persisted; }

    /**
     * @brief Returns how often the producer ran.
     */
    [[nodiscard]] uint64_t getNumberOfComputations() const { return computations; }

    [[nodiscard]] const std::string& getName() const { return name; }

  private:
    std::string name;
    Producer producer;
    bool persisted = false;
    std::optional<std::vector<Windowing::WindowedElement>> cache;
    uint64_t computations = 0;
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_DATASET_HPP_
