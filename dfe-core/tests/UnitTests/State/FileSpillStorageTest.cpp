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
#include <Exceptions/SpillIOException.hpp>
#include <State/FileSpillStorage.hpp>
#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>

namespace DFE::State {

class FileSpillStorageTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("FileSpillStorageTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup FileSpillStorageTest test class.");
    }
};

TEST_F(FileSpillStorageTest, writeReadRemove) {
    auto directory = getTestResourceFolder() / "spill";
    FileSpillStorage storage(directory);
    std::string bytes("binary\0payload", 14);
    storage.write("0-100-0", bytes);
    EXPECT_TRUE(std::filesystem::exists(directory / "0-100-0.spill"));
    EXPECT_EQ(storage.read("0-100-0"), bytes);

    storage.write("0-100-0", "shorter");
    EXPECT_EQ(storage.read("0-100-0"), "shorter");

    storage.remove("0-100-0");
    EXPECT_THROW(storage.read("0-100-0"), Exceptions::SpillIOException);
    EXPECT_THROW(storage.remove("0-100-0"), Exceptions::SpillIOException);
}

TEST_F(FileSpillStorageTest, storageDirectoryIsRemovedWithTheStorage) {
    auto directory = getTestResourceFolder() / "scoped";
    {
        FileSpillStorage storage(directory);
        storage.write("record", "bytes");
        EXPECT_TRUE(std::filesystem::exists(directory));
    }
    EXPECT_FALSE(std::filesystem::exists(directory));
}

TEST_F(FileSpillStorageTest, factoryCreatesSeparateDirectories) {
    auto factory = FileSpillStorageFactory::create(getTestResourceFolder());
    auto first = factory->create();
    auto second = factory->create();
    first->write("record", "first");
    second->write("record", "second");
    EXPECT_EQ(first->read("record"), "first");
    EXPECT_EQ(second->read("record"), "second");
}

}// namespace DFE::State
