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

#include <Configurations/BaseConfiguration.hpp>
#include <DfeBaseTest.hpp>
#include <Util/Logger/Logger.hpp>
#include <fstream>
#include <gtest/gtest.h>

namespace DFE::Configurations {

enum class SpillMode : uint8_t { MEMORY, DISK };

class TestConfiguration : public BaseConfiguration {
  public:
    TestConfiguration() : BaseConfiguration("test", "configuration used in tests"){};

    UIntOption capacity = {"capacity", 10, "number of entries"};
    BoolOption enabled = {"enabled", false, "feature switch"};
    StringOption directory = {"directory", "/tmp", "base directory"};
    FloatOption ratio = {"ratio", 0.5, "a ratio"};
    EnumOption<SpillMode> mode = {"mode", SpillMode::MEMORY, "where entries live"};

  protected:
    std::vector<BaseOption*> getOptions() override { return {&capacity, &enabled, &directory, &ratio, &mode}; }
};

class ConfigurationOptionTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("ConfigurationOptionTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup ConfigurationOptionTest test class.");
    }

    std::string writeFile(const std::string& content) {
        auto path = getTestResourceFolder() / "config.yaml";
        std::ofstream out(path);
        out << content;
        out.close();
        return path.string();
    }
};

TEST_F(ConfigurationOptionTest, defaultValuesAreUsedWithoutInput) {
    TestConfiguration config;
    EXPECT_EQ(config.capacity.getValue(), 10u);
    EXPECT_FALSE(config.enabled.getValue());
    EXPECT_EQ(config.directory.getValue(), "/tmp");
    EXPECT_DOUBLE_EQ(config.ratio.getValue(), 0.5);
    EXPECT_EQ(config.mode.getValue(), SpillMode::MEMORY);
}

TEST_F(ConfigurationOptionTest, commandLineInputOverwritesValues) {
    TestConfiguration config;
    config.overwriteConfigWithCommandLineInput({{"--capacity", "42"}, {"enabled", "true"}, {"--mode", "DISK"}, {"--ratio", "0.25"}});
    EXPECT_EQ(config.capacity.getValue(), 42u);
    EXPECT_TRUE(config.enabled.getValue());
    EXPECT_EQ(config.mode.getValue(), SpillMode::DISK);
    EXPECT_DOUBLE_EQ(config.ratio.getValue(), 0.25);
    EXPECT_EQ(config.directory.getValue(), "/tmp");
}

TEST_F(ConfigurationOptionTest, yamlFileOverwritesValues) {
    TestConfiguration config;
    auto path = writeFile("capacity: 7\ndirectory: /var/spill\nmode: DISK\n");
    config.overwriteConfigWithYAMLFileInput(path);
    EXPECT_EQ(config.capacity.getValue(), 7u);
    EXPECT_EQ(config.directory.getValue(), "/var/spill");
    EXPECT_EQ(config.mode.getValue(), SpillMode::DISK);
}

TEST_F(ConfigurationOptionTest, clearRestoresDefaults) {
    TestConfiguration config;
    config.capacity = 99;
    config.mode = SpillMode::DISK;
    config.clear();
    EXPECT_EQ(config.capacity.getValue(), 10u);
    EXPECT_EQ(config.mode.getValue(), SpillMode::MEMORY);
}

TEST_F(ConfigurationOptionTest, invalidInputIsRejected) {
    TestConfiguration config;
    EXPECT_THROW(config.overwriteConfigWithCommandLineInput({{"--capacity", "many"}}), ConfigurationException);
    EXPECT_THROW(config.overwriteConfigWithCommandLineInput({{"--mode", "CLOUD"}}), ConfigurationException);
    EXPECT_THROW(config.overwriteConfigWithCommandLineInput({{"--unknown", "1"}}), ConfigurationException);
    EXPECT_THROW(config.overwriteConfigWithYAMLFileInput((getTestResourceFolder() / "missing.yaml").string()),
                 ConfigurationException);
    EXPECT_THROW(config.overwriteConfigWithYAMLFileInput(writeFile("capacity: [1, 2]\n")), ConfigurationException);
}

}// namespace DFE::Configurations
