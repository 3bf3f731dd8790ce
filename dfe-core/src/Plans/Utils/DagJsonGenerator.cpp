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

#include <Plans/Utils/DagJsonGenerator.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE {

nlohmann::json DagJsonGenerator::getDagAsJson(const CanonicalDagPtr& dag) {
    DFE_DEBUG("DagJsonGenerator: convert DAG with " << dag->getNumberOfNodes() << " nodes");
    std::vector<nlohmann::json> nodes;
    std::vector<nlohmann::json> edges;
    for (const auto& dagNode : dag->getNodes()) {
        nlohmann::json node;
        node["id"] = dagNode.id;
        node["name"] = dagNode.logicalOperator->getName();
        node["kind"] = DFE::toString(dagNode.logicalOperator->getKind());
        node["rule"] = dagNode.rule->getName();
        if (dagNode.sink) {
            node["sink"] = dagNode.sink->toString();
        }
        nodes.push_back(node);

        for (auto dependency : dagNode.dependencies) {
            nlohmann::json edge;
            edge["source"] = dependency;
            edge["target"] = dagNode.id;
            edges.push_back(edge);
        }
    }

    nlohmann::json result;
    result["nodes"] = nodes;
    result["edges"] = edges;
    return result;
}

}// namespace DFE
