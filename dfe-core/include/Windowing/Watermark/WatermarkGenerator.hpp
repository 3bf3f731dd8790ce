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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WATERMARK_WATERMARKGENERATOR_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WATERMARK_WATERMARKGENERATOR_HPP_

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>

namespace DFE::Windowing {

class WatermarkGenerator;
using WatermarkGeneratorPtr = std::shared_ptr<WatermarkGenerator>;

/**
 * @brief A watermark generator derives the progress of event time from the elements of a stream.
 * A watermark ts states that no further element contributes to a window that ends at or before ts.
 */
class WatermarkGenerator {
  public:
    /**
     * @brief The watermark that is emitted once a bounded input is exhausted.
     */
    static constexpr uint64_t FINAL_WATERMARK = std::numeric_limits<uint64_t>::max();

    virtual ~WatermarkGenerator() = default;

    /**
     * @brief Observes the timestamp of the next element.
     * @param timestamp event time of the element
     * @return a new watermark if the watermark advanced
     */
    virtual std::optional<uint64_t> onElement(uint64_t timestamp) = 0;

    /**
     * @brief Signals the end of a bounded input.
     * @return the final watermark
     */
    virtual uint64_t onEndOfInput() = 0;

    /**
     * @brief Returns the last emitted watermark.
     * @return watermark, 0 if none was emitted
     */
    [[nodiscard]] virtual uint64_t getCurrentWatermark() const = 0;
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_WATERMARK_WATERMARKGENERATOR_HPP_
