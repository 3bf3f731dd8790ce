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

#include <Exceptions/SpillIOException.hpp>
#include <Execution/ExecutionCoordinator.hpp>
#include <Execution/OperatorTranslator.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE::Execution {

ExecutionCoordinator::ExecutionCoordinator(ExecutionContextPtr context) : context(std::move(context)) {
    DFE_ASSERT(this->context, "ExecutionCoordinator requires an execution context");
}

ExecutionCoordinatorPtr ExecutionCoordinator::create(ExecutionContextPtr context) {
    return std::make_shared<ExecutionCoordinator>(std::move(context));
}

ExecutionReport ExecutionCoordinator::execute(const CanonicalDagPtr& dag) {
    DFE_INFO("ExecutionCoordinator: execute DAG with " << dag->getNumberOfNodes() << " nodes");
    context->getFailureCollector()->clear();
    dataSets.assign(dag->getNumberOfNodes(), nullptr);

    for (const auto& node : dag->getNodes()) {
        std::vector<DataSetPtr> inputs;
        for (auto dependency : node.dependencies) {
            inputs.emplace_back(dataSets.at(dependency));
        }
        auto dataSet = node.rule->getTranslator()->translate(node.logicalOperator, inputs, context);
        if (dag->getFanOut(node.id) > 1 && node.logicalOperator->getHints().expensive) {
            dataSet->persist();
        }
        dataSets[node.id] = dataSet;
    }

    for (auto leaf : dag->getLeaves()) {
        const auto& node = dag->getNode(leaf);
        if (node.sink) {
            serveSink(node, dataSets[node.id]);
        } else {
            DFE_WARNING("ExecutionCoordinator: the output of " << node.logicalOperator->getName() << " has no sink and is dropped");
        }
    }

    auto report = context->getFailureCollector()->getReport();
    DFE_INFO("ExecutionCoordinator: " << report.toString());
    return report;
}

void ExecutionCoordinator::serveSink(const DagNode& node, const DataSetPtr& dataSet) {
    DFE_DEBUG("ExecutionCoordinator: serve " << node.sink->toString() << " with " << node.logicalOperator->getName());
    auto writer = node.sink->openWriter(0);
    try {
        auto elements = dataSet->compute();
        for (const auto& element : elements) {
            writer->write(element.getValue());
        }
        writer->commit();
        node.sink->commit();
    } catch (const Exceptions::SpillIOException& e) {
        DFE_ERROR("ExecutionCoordinator: roll back " << node.sink->toString() << ": " << e.what());
        writer->rollback();
        node.sink->rollback();
        context->getFailureCollector()->addFailure(
            Exceptions::ProcessingFailure{Exceptions::FailureKind::SPILL_IO, node.logicalOperator->getName(), "", std::nullopt, e.what()});
    }
}

}// namespace DFE::Execution
