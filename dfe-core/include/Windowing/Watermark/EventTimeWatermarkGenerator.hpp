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

#ifndef DFE_CORE_INCLUDE_WINDOWING_WATERMARK_EVENTTIMEWATERMARKGENERATOR_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_WATERMARK_EVENTTIMEWATERMARKGENERATOR_HPP_

#include <Windowing/Watermark/WatermarkGenerator.hpp>

namespace DFE::Windowing {

/**
 * @brief Generates watermarks for streams with bounded out-of-orderness.
 * The watermark trails the largest observed timestamp by allowedLateness and is emitted every frequency elements.
 */
class EventTimeWatermarkGenerator : public WatermarkGenerator {
  public:
    EventTimeWatermarkGenerator(uint64_t allowedLateness, uint64_t frequency);

    static WatermarkGeneratorPtr create(uint64_t allowedLateness, uint64_t frequency);

    std::optional<uint64_t> onElement(uint64_t timestamp) override;

    uint64_t onEndOfInput() override;

    [[nodiscard]] uint64_t getCurrentWatermark() const override { return currentWatermark; }

  private:
    const uint64_t allowedLateness;
    const uint64_t frequency;
    uint64_t maxTimestamp = 0;
    uint64_t currentWatermark = 0;
    uint64_t elementsSinceLastWatermark = 0;
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_WATERMARK_EVENTTIMEWATERMARKGENERATOR_HPP_
