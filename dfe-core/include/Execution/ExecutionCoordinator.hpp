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

#ifndef DFE_CORE_INCLUDE_EXECUTION_EXECUTIONCOORDINATOR_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_EXECUTIONCOORDINATOR_HPP_

#include <Execution/DataSet.hpp>
#include <Execution/ExecutionContext.hpp>
#include <Execution/FailureCollector.hpp>
#include <Plans/CanonicalDag.hpp>
#include <memory>
#include <vector>

namespace DFE::Execution {

class ExecutionCoordinator;
using ExecutionCoordinatorPtr = std::shared_ptr<ExecutionCoordinator>;

/**
 * @brief Drives a canonical DAG.
 * Every node is translated in node order. Outputs of EXPENSIVE operators with more than one consumer are persisted.
 * Afterwards the output of every node with a sink is computed and its plain values are written to the sink.
 */
class ExecutionCoordinator {
  public:
    explicit ExecutionCoordinator(ExecutionContextPtr context);

    static ExecutionCoordinatorPtr create(ExecutionContextPtr context);

    /**
     * @brief Executes a DAG.
     * A SpillIOException while a sink is served rolls this sink back and is recorded as failure,
     * the other sinks are still served.
     * @param dag the lowered DAG
     * @return the report of contained failures and dropped late elements
     */
    ExecutionReport execute(const CanonicalDagPtr& dag);

    /**
     * @brief Returns the data sets of the last execution, indexed by DAG node id.
     */
    [[nodiscard]] const std::vector<DataSetPtr>& getDataSets() const { return dataSets; }

  private:
    void serveSink(const DagNode& node, const DataSetPtr& dataSet);

    ExecutionContextPtr context;
    std::vector<DataSetPtr> dataSets;
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_EXECUTIONCOORDINATOR_HPP_
