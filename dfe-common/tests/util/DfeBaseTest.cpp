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
#include <algorithm>
#include <fmt/format.h>
#include <random>

namespace DFE::Testing {

namespace {
/**
 * @brief Returns <suite>.<test>-<random suffix>, so that repeated and parallel runs never share a folder.
 */
std::string uniqueResourceFolderName() {
    static std::mt19937_64 generator{std::random_device{}()};
    std::string name = "unknown";
    if (const auto* testInfo = testing::UnitTest::GetInstance()->current_test_info()) {
        name = fmt::format("{}.{}", testInfo->test_suite_name(), testInfo->name());
    }
    // parameterized tests carry a '/' in their names
    std::replace(name.begin(), name.end(), '/', '_');
    return fmt::format("{}-{:016x}", name, generator());
}
}// namespace

DfeBaseTest::DfeBaseTest()
    : testResourcePath(std::filesystem::current_path() / "dfe-test-resources" / uniqueResourceFolderName()) {}

void DfeBaseTest::SetUp() {
    testing::Test::SetUp();
    std::filesystem::remove_all(testResourcePath);
    std::filesystem::create_directories(testResourcePath);
    DFE_DEBUG2("DfeBaseTest: resource folder {}", testResourcePath.string());
}

std::filesystem::path DfeBaseTest::getTestResourceFolder() const { return testResourcePath; }

void DfeBaseTest::TearDown() {
    std::filesystem::remove_all(testResourcePath);
    testing::Test::TearDown();
}

}// namespace DFE::Testing
