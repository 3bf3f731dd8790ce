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

#include <Exceptions/StateCorruptionException.hpp>
#include <State/ByteCodec.hpp>
#include <State/StateSerde.hpp>
#include <bit>
#include <cstdint>
#include <utility>
#include <vector>

namespace DFE::State {

namespace {
void expectFullyConsumed(const ByteReader& reader) {
    if (reader.remaining() != 0) {
        throw Exceptions::StateCorruptionException(std::to_string(reader.remaining()) + " unexpected trailing bytes");
    }
}
}// namespace

StateSerdePtr StringSerde::create() { return std::make_shared<StringSerde>(); }

std::string StringSerde::serialize(const std::any& value) const { return std::any_cast<std::string>(value); }

std::any StringSerde::deserialize(const std::string& bytes) const { return bytes; }

StateSerdePtr Int64Serde::create() { return std::make_shared<Int64Serde>(); }

std::string Int64Serde::serialize(const std::any& value) const {
    ByteWriter writer;
    writer.writeUInt64(static_cast<uint64_t>(std::any_cast<int64_t>(value)));
    return writer.release();
}

std::any Int64Serde::deserialize(const std::string& bytes) const {
    ByteReader reader(bytes);
    auto value = static_cast<int64_t>(reader.readUInt64());
    expectFullyConsumed(reader);
    return value;
}

StateSerdePtr UInt64Serde::create() { return std::make_shared<UInt64Serde>(); }

std::string UInt64Serde::serialize(const std::any& value) const {
    ByteWriter writer;
    writer.writeUInt64(std::any_cast<uint64_t>(value));
    return writer.release();
}

std::any UInt64Serde::deserialize(const std::string& bytes) const {
    ByteReader reader(bytes);
    auto value = reader.readUInt64();
    expectFullyConsumed(reader);
    return value;
}

StateSerdePtr DoubleSerde::create() { return std::make_shared<DoubleSerde>(); }

std::string DoubleSerde::serialize(const std::any& value) const {
    ByteWriter writer;
    writer.writeUInt64(std::bit_cast<uint64_t>(std::any_cast<double>(value)));
    return writer.release();
}

std::any DoubleSerde::deserialize(const std::string& bytes) const {
    ByteReader reader(bytes);
    auto value = std::bit_cast<double>(reader.readUInt64());
    expectFullyConsumed(reader);
    return value;
}

OptionalSerde::OptionalSerde(StateSerdePtr valueSerde) : valueSerde(std::move(valueSerde)) {}

StateSerdePtr OptionalSerde::create(StateSerdePtr valueSerde) { return std::make_shared<OptionalSerde>(std::move(valueSerde)); }

std::string OptionalSerde::serialize(const std::any& value) const {
    ByteWriter writer;
    if (!value.has_value()) {
        writer.writeUInt8(0);
        return writer.release();
    }
    writer.writeUInt8(1);
    writer.writeRaw(valueSerde->serialize(value));
    return writer.release();
}

std::any OptionalSerde::deserialize(const std::string& bytes) const {
    ByteReader reader(bytes);
    auto present = reader.readUInt8();
    if (present == 0) {
        expectFullyConsumed(reader);
        return {};
    }
    if (present != 1) {
        throw Exceptions::StateCorruptionException("invalid presence flag " + std::to_string(present));
    }
    return valueSerde->deserialize(reader.readRaw(reader.remaining()));
}

ListSerde::ListSerde(StateSerdePtr elementSerde) : elementSerde(std::move(elementSerde)) {}

StateSerdePtr ListSerde::create(StateSerdePtr elementSerde) { return std::make_shared<ListSerde>(std::move(elementSerde)); }

std::string ListSerde::serialize(const std::any& value) const {
    const auto& elements = std::any_cast<const std::vector<std::any>&>(value);
    ByteWriter writer;
    writer.writeUInt64(elements.size());
    for (const auto& element : elements) {
        writer.writeBytes(elementSerde->serialize(element));
    }
    return writer.release();
}

std::any ListSerde::deserialize(const std::string& bytes) const {
    ByteReader reader(bytes);
    auto size = reader.readUInt64();
    std::vector<std::any> elements;
    for (uint64_t i = 0; i < size; ++i) {
        elements.emplace_back(elementSerde->deserialize(reader.readBytes()));
    }
    expectFullyConsumed(reader);
    return elements;
}

PairSerde::PairSerde(StateSerdePtr firstSerde, StateSerdePtr secondSerde)
    : firstSerde(std::move(firstSerde)), secondSerde(std::move(secondSerde)) {}

StateSerdePtr PairSerde::create(StateSerdePtr firstSerde, StateSerdePtr secondSerde) {
    return std::make_shared<PairSerde>(std::move(firstSerde), std::move(secondSerde));
}

std::string PairSerde::serialize(const std::any& value) const {
    const auto& pair = std::any_cast<const std::pair<std::any, std::any>&>(value);
    ByteWriter writer;
    writer.writeBytes(firstSerde->serialize(pair.first));
    writer.writeBytes(secondSerde->serialize(pair.second));
    return writer.release();
}

std::any PairSerde::deserialize(const std::string& bytes) const {
    ByteReader reader(bytes);
    auto first = firstSerde->deserialize(reader.readBytes());
    auto second = secondSerde->deserialize(reader.readBytes());
    expectFullyConsumed(reader);
    return std::make_pair(std::move(first), std::move(second));
}

}// namespace DFE::State
