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

#include <Execution/FailureCollector.hpp>
#include <Util/Logger/Logger.hpp>
#include <sstream>

namespace DFE::Execution {

std::vector<Exceptions::ProcessingFailure> ExecutionReport::getFailures(Exceptions::FailureKind kind) const {
    std::vector<Exceptions::ProcessingFailure> result;
    for (const auto& failure : failures) {
        if (failure.kind == kind) {
            result.emplace_back(failure);
        }
    }
    return result;
}

std::string ExecutionReport::toString() const {
    std::stringstream ss;
    ss << "ExecutionReport(failures=" << failures.size() << ", droppedLateElements=" << droppedLateElements << ")";
    for (const auto& failure : failures) {
        ss << std::endl << "  " << failure.toString();
    }
    return ss.str();
}

FailureCollectorPtr FailureCollector::create() { return std::make_shared<FailureCollector>(); }

void FailureCollector::addFailure(const Exceptions::ProcessingFailure& failure) {
    DFE_DEBUG("FailureCollector: " << failure.toString());
    report.failures.emplace_back(failure);
}

void FailureCollector::addOperatorReport(OperatorId operatorId, const ExecutionReport& operatorReport) {
    if (!reportedOperators.insert(operatorId).second) {
        DFE_DEBUG2("FailureCollector: operator {} was recomputed, its report is already counted", operatorId);
        return;
    }
    for (const auto& failure : operatorReport.failures) {
        addFailure(failure);
    }
    report.droppedLateElements += operatorReport.droppedLateElements;
}

ExecutionReport FailureCollector::getReport() const { return report; }

void FailureCollector::clear() {
    report = ExecutionReport();
    reportedOperators.clear();
}

}// namespace DFE::Execution
