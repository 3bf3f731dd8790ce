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

#include <Util/Logger/Logger.hpp>
#include <Windowing/Watermark/EventTimeWatermarkGenerator.hpp>
#include <algorithm>

namespace DFE::Windowing {

EventTimeWatermarkGenerator::EventTimeWatermarkGenerator(uint64_t allowedLateness, uint64_t frequency)
    : allowedLateness(allowedLateness), frequency(frequency) {
    DFE_ASSERT(frequency > 0, "the watermark frequency has to be positive");
}

WatermarkGeneratorPtr EventTimeWatermarkGenerator::create(uint64_t allowedLateness, uint64_t frequency) {
    return std::make_shared<EventTimeWatermarkGenerator>(allowedLateness, frequency);
}

std::optional<uint64_t> EventTimeWatermarkGenerator::onElement(uint64_t timestamp) {
    maxTimestamp = std::max(maxTimestamp, timestamp);
    if (++elementsSinceLastWatermark < frequency) {
        return std::nullopt;
    }
    elementsSinceLastWatermark = 0;
    auto candidate = maxTimestamp > allowedLateness ? maxTimestamp - allowedLateness : 0;
    if (candidate <= currentWatermark) {
        return std::nullopt;
    }
    DFE_TRACE2("EventTimeWatermarkGenerator: advance watermark from {} to {}", currentWatermark, candidate);
    currentWatermark = candidate;
    return currentWatermark;
}

uint64_t EventTimeWatermarkGenerator::onEndOfInput() {
    currentWatermark = FINAL_WATERMARK;
    return currentWatermark;
}

}// namespace DFE::Windowing
