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
#include <Windowing/WindowTypes/SessionWindowing.hpp>
#include <Windowing/WindowTypes/SlidingWindowing.hpp>
#include <Windowing/WindowTypes/TumblingWindowing.hpp>
#include <algorithm>
#include <gtest/gtest.h>

namespace DFE::Windowing {

class WindowTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("WindowTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup WindowTest test class.");
    }
};

TEST_F(WindowTest, windowsAreOrderedByStartThenEnd) {
    std::vector<Window> windows{Window(10, 20), Window(0, 30), Window(0, 10)};
    std::sort(windows.begin(), windows.end());
    EXPECT_EQ(windows[0], Window(0, 10));
    EXPECT_EQ(windows[1], Window(0, 30));
    EXPECT_EQ(windows[2], Window(10, 20));
}

TEST_F(WindowTest, emptyWindowIsRejected) {
    EXPECT_THROW(Window(5, 5), Exceptions::RuntimeException);
    EXPECT_THROW(Window(6, 5), Exceptions::RuntimeException);
}

TEST_F(WindowTest, intersectAndCover) {
    Window first(0, 100);
    EXPECT_TRUE(first.intersects(Window(80, 150)));
    // touching windows belong to the same session
    EXPECT_TRUE(first.intersects(Window(100, 200)));
    EXPECT_FALSE(first.intersects(Window(101, 200)));
    EXPECT_EQ(first.cover(Window(80, 150)), Window(0, 150));
    EXPECT_EQ(first.maxTimestamp(), 99u);
    EXPECT_EQ(first.toString(), "[0, 100)");
}

TEST_F(WindowTest, globalWindowContainsEveryTimestamp) {
    auto global = Window::global();
    EXPECT_TRUE(global.isGlobal());
    EXPECT_TRUE(global.contains(0));
    EXPECT_TRUE(global.contains(1234567));
    EXPECT_FALSE(Window(0, 10).isGlobal());
}

TEST_F(WindowTest, tumblingWindowsAreAlignedAndIdempotent) {
    auto tumbling = TumblingWindowing::of(1000);
    WindowedElement element(std::string("a"), 1800);
    auto windows = tumbling->assignWindows(element);
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0], Window(1000, 2000));
    EXPECT_EQ(tumbling->assignWindows(element), windows);
    EXPECT_FALSE(tumbling->isMerging());
    EXPECT_TRUE(tumbling->mergeWindows(windows).empty());
}

TEST_F(WindowTest, slidingWindowsCoverTheTimestamp) {
    auto sliding = SlidingWindowing::of(1000, 500);
    auto windows = sliding->assignWindows(WindowedElement(0, 1200));
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0], Window(500, 1500));
    EXPECT_EQ(windows[1], Window(1000, 2000));

    auto early = sliding->assignWindows(WindowedElement(0, 100));
    ASSERT_EQ(early.size(), 1u);
    EXPECT_EQ(early[0], Window(0, 1000));
    for (const auto& window : sliding->assignWindows(WindowedElement(0, 7777))) {
        EXPECT_TRUE(window.contains(7777));
    }
}

TEST_F(WindowTest, sessionWindowsMergeOverlappingGroups) {
    auto sessions = SessionWindowing::of(100);
    EXPECT_TRUE(sessions->isMerging());
    EXPECT_EQ(sessions->assignWindows(WindowedElement(0, 40)), std::vector<Window>{Window(40, 140)});

    auto merges = sessions->mergeWindows({Window(80, 150), Window(300, 400), Window(0, 100)});
    ASSERT_EQ(merges.size(), 1u);
    EXPECT_EQ(merges[0].getMergedWindow(), Window(0, 150));
    EXPECT_EQ(merges[0].getSources(), (std::vector<Window>{Window(0, 100), Window(80, 150)}));
}

TEST_F(WindowTest, sessionMergeClosesTransitively) {
    auto sessions = SessionWindowing::of(100);
    auto merges = sessions->mergeWindows({Window(0, 100), Window(90, 190), Window(180, 280), Window(500, 600)});
    ASSERT_EQ(merges.size(), 1u);
    EXPECT_EQ(merges[0].getMergedWindow(), Window(0, 280));
    EXPECT_EQ(merges[0].getSources().size(), 3u);
    EXPECT_TRUE(sessions->mergeWindows({Window(0, 100)}).empty());
}

TEST_F(WindowTest, elementsWithoutStrategyInheritTheirWindows) {
    WindowedElement plain(0, 10);
    EXPECT_EQ(WindowingStrategy::assignOrInherit(nullptr, plain), std::vector<Window>{Window::global()});

    WindowedElement windowed(0, 10, {Window(0, 50)});
    EXPECT_EQ(WindowingStrategy::assignOrInherit(nullptr, windowed), std::vector<Window>{Window(0, 50)});
    EXPECT_EQ(WindowingStrategy::assignOrInherit(TumblingWindowing::of(5), windowed), std::vector<Window>{Window(10, 15)});
}

}// namespace DFE::Windowing
