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

#ifndef DFE_TESTS_UTIL_DFEBASETEST_HPP_
#define DFE_TESTS_UTIL_DFEBASETEST_HPP_

#include <Util/Logger/Logger.hpp>
#include <filesystem>
#include <gtest/gtest.h>

namespace DFE::Testing {

class DfeBaseTest : public testing::Test {
  public:
    /**
     * @brief Chooses a resource folder unique to the running test
     */
    explicit DfeBaseTest();

    /**
     * @brief Creates a clean resource folder for the test
     */
    void SetUp() override;

    /**
     * @brief Removes the resource folder of the test
     */
    void TearDown() override;

  protected:
    /**
     * @brief returns the test resource folder to write files
     * @return the test folder
     */
    std::filesystem::path getTestResourceFolder() const;

  private:
    std::filesystem::path testResourcePath;
};
}// namespace DFE::Testing

#endif//DFE_TESTS_UTIL_DFEBASETEST_HPP_
