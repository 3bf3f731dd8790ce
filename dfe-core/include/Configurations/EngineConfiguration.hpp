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

#ifndef DFE_CORE_INCLUDE_CONFIGURATIONS_ENGINECONFIGURATION_HPP_
#define DFE_CORE_INCLUDE_CONFIGURATIONS_ENGINECONFIGURATION_HPP_

#include <Configurations/BaseConfiguration.hpp>
#include <Configurations/ConfigurationOption.hpp>
#include <Util/Logger/LogLevel.hpp>
#include <memory>
#include <string>
#include <vector>

namespace DFE::Configurations {

class EngineConfiguration;
using EngineConfigurationPtr = std::shared_ptr<EngineConfiguration>;

/**
 * @brief ConfigOptions of the lowering and execution engine.
 */
class EngineConfiguration : public BaseConfiguration {
  public:
    EngineConfiguration() : BaseConfiguration(){};
    EngineConfiguration(const std::string& name, const std::string& description) : BaseConfiguration(name, description){};

    /**
     * @brief The runtime log level, valid values are the names of DFE::LogLevel.
     */
    EnumOption<LogLevel> logLevel = {LOG_LEVEL_CONFIG,
                                     LogLevel::LOG_INFO,
                                     "The log level (LOG_NONE, LOG_WARNING, LOG_DEBUG, LOG_INFO, LOG_TRACE)"};

    /**
     * @brief Number of (key, window) entries a keyed operator keeps in memory before it spills.
     */
    UIntOption maxInMemoryStateEntries = {MAX_IN_MEMORY_STATE_ENTRIES_CONFIG,
                                         100000,
                                         "Maximal number of state entries per operator that are kept in memory"};

    /**
     * @brief Base directory of the file spill storage, every storage creates its own sub directory.
     */
    StringOption spillDirectory = {SPILL_DIRECTORY_CONFIG, "./dfe-spill", "Directory for spilled state entries"};

    /**
     * @brief A join side with at most this many estimated elements is broadcast.
     */
    UIntOption broadcastJoinThreshold = {BROADCAST_JOIN_THRESHOLD_CONFIG,
                                         10000,
                                         "Maximal estimated number of elements of a broadcast join side"};

    /**
     * @brief Watermarks lag this many milliseconds behind the maximal event time.
     */
    UIntOption allowedLateness = {ALLOWED_LATENESS_CONFIG, 0, "Allowed lateness of elements in milliseconds"};

    UIntOption watermarkFrequency = {WATERMARK_FREQUENCY_CONFIG, 1, "Number of elements between two watermarks"};

    UIntOption maxDecompositionDepth = {MAX_DECOMPOSITION_DEPTH_CONFIG,
                                        32,
                                        "Maximal nesting of operator decompositions during lowering"};

    /**
     * @brief Create an EngineConfiguration object with default values.
     * @return An EngineConfiguration object with default values.
     */
    static EngineConfigurationPtr create() { return std::make_shared<EngineConfiguration>(); }

    /**
     * @brief Create an EngineConfiguration object and set values from the POSIX command line parameters stored in argv.
     * Arguments have the form --name=value. If --configPath is given, the YAML file is applied first.
     * @param argc The argc parameter given to the main function.
     * @param argv The argv parameter given to the main function.
     * @return A configured configuration object.
     * @throws ConfigurationException for malformed arguments or invalid values
     */
    static EngineConfigurationPtr create(int argc, const char** argv);

  private:
    std::vector<Configurations::BaseOption*> getOptions() override {
        return {&logLevel,
                &maxInMemoryStateEntries,
                &spillDirectory,
                &broadcastJoinThreshold,
                &allowedLateness,
                &watermarkFrequency,
                &maxDecompositionDepth};
    }
};

}// namespace DFE::Configurations

#endif// DFE_CORE_INCLUDE_CONFIGURATIONS_ENGINECONFIGURATION_HPP_
