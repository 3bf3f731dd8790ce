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

#ifndef DFE_CORE_INCLUDE_OPERATORS_LOGICALOPERATOR_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_LOGICALOPERATOR_HPP_

#include <Operators/OperatorDescriptors.hpp>
#include <Operators/OperatorHints.hpp>
#include <Operators/OperatorKind.hpp>
#include <Windowing/WindowTypes/WindowingStrategy.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace DFE {

using OperatorId = uint64_t;

class LogicalOperator;
using LogicalOperatorPtr = std::shared_ptr<const LogicalOperator>;

/**
 * @brief Returns the next free operator id of this process.
 */
OperatorId getNextOperatorId();

/**
 * @brief A node of a flow graph.
 * Logical operators are immutable, lowering never modifies the operators of a flow graph.
 */
class LogicalOperator {
  public:
    LogicalOperator(OperatorId id,
                    std::string name,
                    std::vector<LogicalOperatorPtr> inputs,
                    OperatorDescriptor descriptor,
                    Windowing::WindowingStrategyPtr windowing,
                    OperatorHints hints);

    [[nodiscard]] OperatorId getId() const { return id; }

    [[nodiscard]] const std::string& getName() const { return name; }

    /**
     * @brief Returns the kind of the operator, derived from its descriptor.
     */
    [[nodiscard]] OperatorKind getKind() const;

    [[nodiscard]] const std::vector<LogicalOperatorPtr>& getInputs() const { return inputs; }

    [[nodiscard]] const OperatorDescriptor& getDescriptor() const { return descriptor; }

    /**
     * @brief Returns the windowing of the operator, nullptr if the operator is not windowed.
     */
    [[nodiscard]] const Windowing::WindowingStrategyPtr& getWindowing() const { return windowing; }

    [[nodiscard]] const OperatorHints& getHints() const { return hints; }

    /**
     * @brief Checks if the descriptor of this operator is of type DescriptorType.
     */
    template<class DescriptorType>
    [[nodiscard]] bool instanceOf() const {
        return std::holds_alternative<DescriptorType>(descriptor);
    }

    /**
     * @brief Returns the descriptor as DescriptorType.
     * @throws std::bad_variant_access if the operator has another kind
     */
    template<class DescriptorType>
    [[nodiscard]] const DescriptorType& as() const {
        return std::get<DescriptorType>(descriptor);
    }

    [[nodiscard]] std::string toString() const;

  private:
    const OperatorId id;
    const std::string name;
    const std::vector<LogicalOperatorPtr> inputs;
    const OperatorDescriptor descriptor;
    const Windowing::WindowingStrategyPtr windowing;
    const OperatorHints hints;
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_LOGICALOPERATOR_HPP_
