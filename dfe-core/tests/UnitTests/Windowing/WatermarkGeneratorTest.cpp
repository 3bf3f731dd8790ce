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

#include <DfeBaseTest.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/Watermark/EventTimeWatermarkGenerator.hpp>
#include <gtest/gtest.h>

namespace DFE::Windowing {

class WatermarkGeneratorTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("WatermarkGeneratorTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup WatermarkGeneratorTest test class.");
    }
};

TEST_F(WatermarkGeneratorTest, watermarkTrailsMaximumTimestamp) {
    auto generator = EventTimeWatermarkGenerator::create(10, 1);
    EXPECT_EQ(generator->onElement(100), std::optional<uint64_t>(90));
    // out of order elements do not move the watermark back
    EXPECT_FALSE(generator->onElement(95).has_value());
    EXPECT_EQ(generator->getCurrentWatermark(), 90u);
    EXPECT_EQ(generator->onElement(150), std::optional<uint64_t>(140));
    EXPECT_EQ(generator->onEndOfInput(), WatermarkGenerator::FINAL_WATERMARK);
}

TEST_F(WatermarkGeneratorTest, watermarkIsEmittedEveryNthElement) {
    auto generator = EventTimeWatermarkGenerator::create(0, 2);
    EXPECT_FALSE(generator->onElement(100).has_value());
    EXPECT_EQ(generator->onElement(50), std::optional<uint64_t>(100));
    EXPECT_FALSE(generator->onElement(300).has_value());
    EXPECT_EQ(generator->onElement(301), std::optional<uint64_t>(301));
}

TEST_F(WatermarkGeneratorTest, latenessLargerThanTimestampsKeepsWatermarkAtZero) {
    auto generator = EventTimeWatermarkGenerator::create(1000, 1);
    EXPECT_FALSE(generator->onElement(10).has_value());
    EXPECT_EQ(generator->getCurrentWatermark(), 0u);
    EXPECT_THROW(EventTimeWatermarkGenerator::create(0, 0), Exceptions::RuntimeException);
}

}// namespace DFE::Windowing
