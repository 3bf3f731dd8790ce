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

#ifndef DFE_CORE_INCLUDE_STATE_STATESERDE_HPP_
#define DFE_CORE_INCLUDE_STATE_STATESERDE_HPP_

#include <any>
#include <memory>
#include <string>

namespace DFE::State {

class StateSerde;
using StateSerdePtr = std::shared_ptr<StateSerde>;

/**
 * @brief Converts keys and accumulators between their in-memory representation and bytes.
 * The encoded bytes of a key define its identity in the state store.
 * Deserializing bytes that were not produced by serialize throws a StateCorruptionException.
 */
class StateSerde {
  public:
    virtual ~StateSerde() = default;

    [[nodiscard]] virtual std::string serialize(const std::any& value) const = 0;

    [[nodiscard]] virtual std::any deserialize(const std::string& bytes) const = 0;
};

/**
 * @brief Serde for std::string values.
 */
class StringSerde : public StateSerde {
  public:
    static StateSerdePtr create();
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;
};

/**
 * @brief Serde for int64_t values.
 */
class Int64Serde : public StateSerde {
  public:
    static StateSerdePtr create();
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;
};

/**
 * @brief Serde for uint64_t values.
 */
class UInt64Serde : public StateSerde {
  public:
    static StateSerdePtr create();
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;
};

/**
 * @brief Serde for double values.
 */
class DoubleSerde : public StateSerde {
  public:
    static StateSerdePtr create();
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;
};

/**
 * @brief Serde for values that may be absent, i.e., an empty std::any.
 */
class OptionalSerde : public StateSerde {
  public:
    explicit OptionalSerde(StateSerdePtr valueSerde);
    static StateSerdePtr create(StateSerdePtr valueSerde);
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;

  private:
    StateSerdePtr valueSerde;
};

/**
 * @brief Serde for std::vector<std::any> whose elements share one serde.
 */
class ListSerde : public StateSerde {
  public:
    explicit ListSerde(StateSerdePtr elementSerde);
    static StateSerdePtr create(StateSerdePtr elementSerde);
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;

  private:
    StateSerdePtr elementSerde;
};

/**
 * @brief Serde for std::pair<std::any, std::any> with one serde per side.
 */
class PairSerde : public StateSerde {
  public:
    PairSerde(StateSerdePtr firstSerde, StateSerdePtr secondSerde);
    static StateSerdePtr create(StateSerdePtr firstSerde, StateSerdePtr secondSerde);
    [[nodiscard]] std::string serialize(const std::any& value) const override;
    [[nodiscard]] std::any deserialize(const std::string& bytes) const override;

  private:
    StateSerdePtr firstSerde;
    StateSerdePtr secondSerde;
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_STATESERDE_HPP_
