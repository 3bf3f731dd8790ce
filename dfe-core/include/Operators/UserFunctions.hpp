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

#ifndef DFE_CORE_INCLUDE_OPERATORS_USERFUNCTIONS_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_USERFUNCTIONS_HPP_

#include <any>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace DFE {

/**
 * @brief Receives the output of user functions.
 */
class Collector {
  public:
    virtual ~Collector() = default;

    virtual void collect(std::any value) = 0;
};

/**
 * @brief Collector that appends all values to a vector.
 */
class VectorCollector : public Collector {
  public:
    void collect(std::any value) override { values.emplace_back(std::move(value)); }

    [[nodiscard]] const std::vector<std::any>& getValues() const { return values; }

    /**
     * @brief Returns the collected values and leaves the collector empty.
     */
    std::vector<std::any> release() {
        std::vector<std::any> result;
        result.swap(values);
        return result;
    }

  private:
    std::vector<std::any> values;
};

using FlatMapFunction = std::function<void(const std::any& value, Collector& collector)>;
using MapFunction = std::function<std::any(const std::any& value)>;
using FilterPredicate = std::function<bool(const std::any& value)>;
using KeyExtractor = std::function<std::any(const std::any& value)>;
using ValueExtractor = std::function<std::any(const std::any& value)>;
using TimestampExtractor = std::function<uint64_t(const std::any& value)>;

/**
 * @brief Reduces all values of a key and window to one value.
 * A combinable reducer is associative and returns the type of its inputs, so it can be applied to partial results.
 */
using ReduceFunction = std::function<std::any(const std::vector<std::any>& values)>;

/**
 * @brief Joins a left and a right value of the same key.
 * For outer joins the missing side is passed as an empty std::any.
 */
using JoinFunction = std::function<void(const std::any& left, const std::any& right, Collector& collector)>;

/**
 * @brief Functions that define the accumulator of a keyed state operator.
 */
struct AccumulatorFunctions {
    // creates an empty accumulator
    std::function<std::any()> create;
    // folds a value into an accumulator and returns the new accumulator
    std::function<std::any(const std::any& accumulator, const std::any& value)> add;
    // combines two accumulators of the same key, used when windows are merged
    std::function<std::any(const std::any& left, const std::any& right)> combine;
    // emits the results of an accumulator when its window fires
    std::function<void(const std::any& key, const std::any& accumulator, Collector& collector)> flush;
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_USERFUNCTIONS_HPP_
