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

#include <Exceptions/LoweringException.hpp>
#include <Plans/FlowGraph.hpp>
#include <Util/Logger/Logger.hpp>
#include <algorithm>
#include <sstream>

namespace DFE {

FlowGraph::FlowGraph(std::string name) : name(std::move(name)) {}

FlowGraphPtr FlowGraph::create(std::string name) { return std::make_shared<FlowGraph>(std::move(name)); }

void FlowGraph::addOperator(const LogicalOperatorPtr& logicalOperator) {
    DFE_ASSERT(logicalOperator, "FlowGraph: operator must not be null");
    if (contains(logicalOperator->getId())) {
        throw Exceptions::LoweringException("FlowGraph " + name + ": operator id " + std::to_string(logicalOperator->getId())
                                            + " is already used");
    }
    for (const auto& input : logicalOperator->getInputs()) {
        if (!input || !contains(input->getId())) {
            throw Exceptions::LoweringException("FlowGraph " + name + ": input of " + logicalOperator->getName()
                                                + " has to be added before the operator");
        }
        if (sinks.contains(input->getId())) {
            throw Exceptions::LoweringException("FlowGraph " + name + ": " + input->getName()
                                                + " has a sink and cannot be consumed by " + logicalOperator->getName());
        }
    }
    DFE_DEBUG("FlowGraph " << name << ": add " << logicalOperator->toString());
    operators.emplace_back(logicalOperator);
}

void FlowGraph::attachSink(const LogicalOperatorPtr& logicalOperator, Sinks::DataSinkPtr sink) {
    DFE_ASSERT(sink, "FlowGraph: sink must not be null");
    if (!logicalOperator || !contains(logicalOperator->getId())) {
        throw Exceptions::LoweringException("FlowGraph " + name + ": cannot attach a sink to an unknown operator");
    }
    if (hasConsumers(logicalOperator->getId())) {
        throw Exceptions::LoweringException("FlowGraph " + name + ": only leaves receive a sink, " + logicalOperator->getName()
                                            + " has consumers");
    }
    if (!sinks.emplace(logicalOperator->getId(), std::move(sink)).second) {
        throw Exceptions::LoweringException("FlowGraph " + name + ": operator " + logicalOperator->getName()
                                            + " already has a sink");
    }
}

bool FlowGraph::contains(OperatorId id) const {
    return std::any_of(operators.begin(), operators.end(), [id](const LogicalOperatorPtr& op) {
        return op->getId() == id;
    });
}

bool FlowGraph::hasConsumers(OperatorId id) const {
    return std::any_of(operators.begin(), operators.end(), [id](const LogicalOperatorPtr& op) {
        const auto& inputs = op->getInputs();
        return std::any_of(inputs.begin(), inputs.end(), [id](const LogicalOperatorPtr& input) {
            return input->getId() == id;
        });
    });
}

Sinks::DataSinkPtr FlowGraph::getSink(OperatorId id) const {
    auto it = sinks.find(id);
    return it == sinks.end() ? nullptr : it->second;
}

OperatorId FlowGraph::getMaxOperatorId() const {
    OperatorId maxId = 0;
    for (const auto& op : operators) {
        maxId = std::max(maxId, op->getId());
    }
    return maxId;
}

std::string FlowGraph::toString() const {
    std::stringstream ss;
    ss << "FlowGraph(" << name << ")" << std::endl;
    for (const auto& op : operators) {
        ss << "  " << op->toString();
        if (auto sink = getSink(op->getId())) {
            ss << " -> " << sink->toString();
        }
        ss << std::endl;
    }
    return ss.str();
}

}// namespace DFE
