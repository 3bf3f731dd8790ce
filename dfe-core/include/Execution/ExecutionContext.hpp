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

#ifndef DFE_CORE_INCLUDE_EXECUTION_EXECUTIONCONTEXT_HPP_
#define DFE_CORE_INCLUDE_EXECUTION_EXECUTIONCONTEXT_HPP_

#include <Configurations/EngineConfiguration.hpp>
#include <Execution/FailureCollector.hpp>
#include <Operators/KeyComparators.hpp>
#include <State/SpillStorage.hpp>
#include <cstdint>
#include <memory>

namespace DFE::Execution {

class ExecutionContext;
using ExecutionContextPtr = std::shared_ptr<ExecutionContext>;

/**
 * @brief Everything the translators need besides the operator and its inputs.
 */
class ExecutionContext {
  public:
    /**
     * @brief Constructor to create an ExecutionContext
     * @param stateCapacity in-memory entries of every state store
     * @param allowedLateness watermark delay in milliseconds
     * @param watermarkFrequency elements between two watermarks
     * @param spillStorageFactory creates the spill storage of every state store
     * @param comparators key comparators for sorting strategies
     */
    ExecutionContext(uint64_t stateCapacity,
                     uint64_t allowedLateness,
                     uint64_t watermarkFrequency,
                     State::SpillStorageFactoryPtr spillStorageFactory,
                     KeyComparatorsPtr comparators);

    /**
     * @brief Creates a context from the engine configuration and applies its log level, spilled state goes to FileSpillStorage.
     */
    static ExecutionContextPtr create(const Configurations::EngineConfigurationPtr& configuration,
                                      KeyComparatorsPtr comparators = KeyComparators::create());

    [[nodiscard]] uint64_t getStateCapacity() const { return stateCapacity; }

    [[nodiscard]] uint64_t getAllowedLateness() const { return allowedLateness; }

    [[nodiscard]] uint64_t getWatermarkFrequency() const { return watermarkFrequency; }

    [[nodiscard]] const State::SpillStorageFactoryPtr& getSpillStorageFactory() const { return spillStorageFactory; }

    [[nodiscard]] const KeyComparatorsPtr& getComparators() const { return comparators; }

    [[nodiscard]] const FailureCollectorPtr& getFailureCollector() const { return failureCollector; }

  private:
    const uint64_t stateCapacity;
    const uint64_t allowedLateness;
    const uint64_t watermarkFrequency;
    const State::SpillStorageFactoryPtr spillStorageFactory;
    const KeyComparatorsPtr comparators;
    const FailureCollectorPtr failureCollector;
};

}// namespace DFE::Execution

#endif// DFE_CORE_INCLUDE_EXECUTION_EXECUTIONCONTEXT_HPP_
