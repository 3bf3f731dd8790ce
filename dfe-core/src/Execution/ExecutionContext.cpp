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

#include <Execution/ExecutionContext.hpp>
#include <State/FileSpillStorage.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE::Execution {

ExecutionContext::ExecutionContext(uint64_t stateCapacity,
                                   uint64_t allowedLateness,
                                   uint64_t watermarkFrequency,
                                   State::SpillStorageFactoryPtr spillStorageFactory,
                                   KeyComparatorsPtr comparators)
    : stateCapacity(stateCapacity), allowedLateness(allowedLateness), watermarkFrequency(watermarkFrequency),
      spillStorageFactory(std::move(spillStorageFactory)),
      comparators(std::move(comparators)), failureCollector(FailureCollector::create()) {
    DFE_ASSERT(this->stateCapacity > 0, "the state capacity has to be at least 1");
    DFE_ASSERT(this->watermarkFrequency > 0, "the watermark frequency has to be at least 1");
    DFE_ASSERT(this->spillStorageFactory && this->comparators, "ExecutionContext requires a spill storage factory and comparators");
}

ExecutionContextPtr ExecutionContext::create(const Configurations::EngineConfigurationPtr& configuration,
                                             KeyComparatorsPtr comparators) {
    Logger::getInstance().changeLogLevel(configuration->logLevel.getValue());
    return std::make_shared<ExecutionContext>(configuration->maxInMemoryStateEntries.getValue(),
                                              configuration->allowedLateness.getValue(),
                                              configuration->watermarkFrequency.getValue(),
                                              State::FileSpillStorageFactory::create(configuration->spillDirectory.getValue()),
                                              std::move(comparators));
}

}// namespace DFE::Execution
