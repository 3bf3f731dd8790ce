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

#ifndef DFE_CORE_INCLUDE_EXECUTION_FAILURECOLLECTOR_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_FAILURECOLLECTOR_HPP_

#include <Exceptions/ProcessingFailure.hpp>
#include <Operators/LogicalOperator.hpp>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace DFE::Execution {

/**
 * @brief The outcome of executing a canonical DAG.
 */
struct ExecutionReport {
    std::vector<Exceptions::ProcessingFailure> failures;
    uint64_t droppedLateElements = 0;

    [[nodiscard]] bool hasFailures() const { return !failures.empty(); }

    /**
     * @brief Returns the failures of one kind in the order they occurred.
     */
    [[nodiscard]] std::vector<Exceptions::ProcessingFailure> getFailures(Exceptions::FailureKind kind) const;

    [[nodiscard]] std::string toString() const;
};

class FailureCollector;
using FailureCollectorPtr = std::shared_ptr<FailureCollector>;

/**
 * @brief Collects the contained failures and late elements of all operators of one execution.
 */
class FailureCollector {
  public:
    static FailureCollectorPtr create();

    void addFailure(const Exceptions::ProcessingFailure& failure);

    /**
     * @brief Adds the failures and late elements one run of an operator produced.
     * A data set that is not persisted runs its operator once per consumer, only the first run of an operator is counted.
     * @param operatorId the operator that produced the report
     * @param operatorReport failures and dropped late elements of that run
     */
    void addOperatorReport(OperatorId operatorId, const ExecutionReport& operatorReport);

    [[nodiscard]] ExecutionReport getReport() const;

    void clear();

  private:
    ExecutionReport report;
    std::set<OperatorId> reportedOperators;
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_FAILURECOLLECTOR_HPP_
