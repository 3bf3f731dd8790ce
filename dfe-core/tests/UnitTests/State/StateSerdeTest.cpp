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
#include <Exceptions/StateCorruptionException.hpp>
#include <State/SpillRecord.hpp>
#include <State/StateSerde.hpp>
#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>

namespace DFE::State {

class StateSerdeTest : public Testing::DfeBaseTest {
  public:
    static void SetUpTestCase() {
        DFE::Logger::setupLogging("StateSerdeTest.log", DFE::LogLevel::LOG_DEBUG);
        DFE_INFO("Setup StateSerdeTest test class.");
    }
};

TEST_F(StateSerdeTest, scalarSerdes) {
    auto int64Serde = Int64Serde::create();
    EXPECT_EQ(std::any_cast<int64_t>(int64Serde->deserialize(int64Serde->serialize(int64_t{-42}))), -42);
    EXPECT_EQ(int64Serde->serialize(int64_t{7}).size(), 8u);

    auto doubleSerde = DoubleSerde::create();
    EXPECT_DOUBLE_EQ(std::any_cast<double>(doubleSerde->deserialize(doubleSerde->serialize(2.5))), 2.5);

    auto stringSerde = StringSerde::create();
    EXPECT_EQ(stringSerde->serialize(std::string("key")), "key");
}

TEST_F(StateSerdeTest, equalKeysHaveEqualBytes) {
    auto serde = StringSerde::create();
    EXPECT_EQ(serde->serialize(std::string("a")), serde->serialize(std::string("a")));
    EXPECT_NE(serde->serialize(std::string("a")), serde->serialize(std::string("b")));
}

TEST_F(StateSerdeTest, composedSerdes) {
    auto optionalSerde = OptionalSerde::create(Int64Serde::create());
    EXPECT_FALSE(optionalSerde->deserialize(optionalSerde->serialize(std::any())).has_value());
    EXPECT_EQ(std::any_cast<int64_t>(optionalSerde->deserialize(optionalSerde->serialize(int64_t{5}))), 5);

    auto listSerde = ListSerde::create(StringSerde::create());
    std::vector<std::any> values{std::string("x"), std::string(""), std::string("yz")};
    auto decoded = std::any_cast<std::vector<std::any>>(listSerde->deserialize(listSerde->serialize(values)));
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(std::any_cast<std::string>(decoded[1]), "");
    EXPECT_EQ(std::any_cast<std::string>(decoded[2]), "yz");

    auto pairSerde = PairSerde::create(StringSerde::create(), Int64Serde::create());
    auto pair = std::any_cast<std::pair<std::any, std::any>>(
        pairSerde->deserialize(pairSerde->serialize(std::make_pair(std::any(std::string("k")), std::any(int64_t{3})))));
    EXPECT_EQ(std::any_cast<std::string>(pair.first), "k");
    EXPECT_EQ(std::any_cast<int64_t>(pair.second), 3);
}

TEST_F(StateSerdeTest, malformedBytesAreReportedAsCorruption) {
    auto int64Serde = Int64Serde::create();
    EXPECT_THROW(int64Serde->deserialize("abc"), Exceptions::StateCorruptionException);
    EXPECT_THROW(int64Serde->deserialize(std::string(9, 'x')), Exceptions::StateCorruptionException);

    auto optionalSerde = OptionalSerde::create(Int64Serde::create());
    EXPECT_THROW(optionalSerde->deserialize(std::string(1, '\x07')), Exceptions::StateCorruptionException);
}

TEST_F(StateSerdeTest, spillRecordKeepsKeyWindowAndValue) {
    SpillRecord record("key", Windowing::Window(10, 20), "value");
    auto decoded = SpillRecord::decode(record.encode());
    EXPECT_EQ(decoded.getKeyBytes(), "key");
    EXPECT_EQ(decoded.getWindow(), Windowing::Window(10, 20));
    EXPECT_EQ(decoded.getValueBytes(), "value");
}

TEST_F(StateSerdeTest, damagedSpillRecordIsRejected) {
    auto bytes = SpillRecord("key", Windowing::Window(10, 20), "value").encode();
    EXPECT_THROW(SpillRecord::decode(bytes.substr(0, 6)), Exceptions::StateCorruptionException);

    auto flipped = bytes;
    flipped[flipped.size() / 2] ^= 0x01;
    EXPECT_THROW(SpillRecord::decode(flipped), Exceptions::StateCorruptionException);

    EXPECT_THROW(SpillRecord::decode(bytes + "x"), Exceptions::StateCorruptionException);
}

}// namespace DFE::State
