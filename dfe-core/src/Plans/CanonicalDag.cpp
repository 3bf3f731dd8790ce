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

#include <Plans/CanonicalDag.hpp>
#include <Util/Logger/Logger.hpp>
#include <sstream>

namespace DFE {

CanonicalDagPtr CanonicalDag::create() { return std::make_shared<CanonicalDag>(); }

DagNodeId
CanonicalDag::addNode(LogicalOperatorPtr logicalOperator, Lowering::TranslationRulePtr rule, std::vector<DagNodeId> dependencies) {
    DFE_ASSERT(logicalOperator && rule, "CanonicalDag: a node needs an operator and a rule");
    DagNodeId id = nodes.size();
    for (auto dependency : dependencies) {
        DFE_ASSERT(dependency < id, "CanonicalDag: dependency " << dependency << " of node " << id << " does not exist");
        nodes[dependency].consumers.emplace_back(id);
    }
    nodes.emplace_back(DagNode{id, std::move(logicalOperator), std::move(rule), std::move(dependencies), {}, nullptr});
    return id;
}

void CanonicalDag::attachSink(DagNodeId id, Sinks::DataSinkPtr sink) {
    DFE_ASSERT(id < nodes.size(), "CanonicalDag: node " << id << " does not exist");
    DFE_ASSERT(!nodes[id].sink, "CanonicalDag: node " << id << " already has a sink");
    nodes[id].sink = std::move(sink);
}

const DagNode& CanonicalDag::getNode(DagNodeId id) const {
    DFE_ASSERT(id < nodes.size(), "CanonicalDag: node " << id << " does not exist");
    return nodes[id];
}

uint64_t CanonicalDag::getFanOut(DagNodeId id) const { return getNode(id).consumers.size(); }

std::vector<DagNodeId> CanonicalDag::getLeaves() const {
    std::vector<DagNodeId> leaves;
    for (const auto& node : nodes) {
        if (node.consumers.empty()) {
            leaves.emplace_back(node.id);
        }
    }
    return leaves;
}

std::string CanonicalDag::toString() const {
    std::stringstream ss;
    for (const auto& node : nodes) {
        ss << node.id << ": " << DFE::toString(node.logicalOperator->getKind()) << "(" << node.logicalOperator->getName()
           << ") rule=" << node.rule->getName() << " inputs=[";
        for (size_t i = 0; i < node.dependencies.size(); ++i) {
            ss << (i == 0 ? "" : ", ") << node.dependencies[i];
        }
        ss << "]";
        if (node.sink) {
            ss << " sink=" << node.sink->toString();
        }
        ss << std::endl;
    }
    return ss.str();
}

}// namespace DFE
