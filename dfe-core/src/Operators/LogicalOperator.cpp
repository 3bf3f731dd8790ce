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

#include <Operators/LogicalOperator.hpp>
#include <atomic>
#include <sstream>

namespace DFE {

static_assert(std::variant_size_v<OperatorDescriptor> == magic_enum::enum_count<OperatorKind>(),
              "every operator kind needs a descriptor");

OperatorId getNextOperatorId() {
    static std::atomic<OperatorId> id = 1;
    return id++;
}

LogicalOperator::LogicalOperator(OperatorId id,
                                 std::string name,
                                 std::vector<LogicalOperatorPtr> inputs,
                                 OperatorDescriptor descriptor,
                                 Windowing::WindowingStrategyPtr windowing,
                                 OperatorHints hints)
    : id(id), name(std::move(name)), inputs(std::move(inputs)), descriptor(std::move(descriptor)),
      windowing(std::move(windowing)), hints(hints) {}

OperatorKind LogicalOperator::getKind() const { return static_cast<OperatorKind>(descriptor.index()); }

std::string LogicalOperator::toString() const {
    std::stringstream ss;
    ss << DFE::toString(getKind()) << "(" << id << ", " << name;
    if (windowing) {
        ss << ", " << windowing->toString();
    }
    if (hints.expensive) {
        ss << ", EXPENSIVE";
    }
    ss << ")";
    return ss.str();
}

}// namespace DFE
