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

#ifndef DFE_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_
#define DFE_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_

#include <Configurations/BaseOption.hpp>
#include <Configurations/ConfigurationException.hpp>
#include <Configurations/EnumOption.hpp>
#include <Configurations/ScalarOption.hpp>
#include <map>
#include <string>
#include <vector>

namespace DFE::Configurations {

/**
 * @brief This class is the bases for all configuration.
 * A configuration contains a set of config option as member fields and corresponds to a dedicated YAML file,
 * e.g., see EngineConfiguration.
 * To identify a member field, all configuration have to implement getOptions() and return a list of all options.
 */
class BaseConfiguration : public BaseOption {
  public:
    BaseConfiguration();

    /**
     * @brief Constructor to create a new configuration object.
     * @param name of the configuration.
     * @param description of the configuration.
     */
    BaseConfiguration(const std::string& name, const std::string& description);

    ~BaseConfiguration() override = default;

    /**
     * @brief Overwrites the default and current config values with the content of a YAML file.
     * @param filePath path of the YAML file
     * @throws ConfigurationException if the file does not exist, is malformed or contains unknown options.
     */
    void overwriteConfigWithYAMLFileInput(const std::string& filePath);

    /**
     * @brief Overwrites the default and current config values with command line input.
     * Identifiers may carry a leading "--", e.g., --maxInMemoryStateEntries=10.
     * @param inputParams map with key=option identifier and value=option value
     * @throws ConfigurationException if an identifier is unknown or a value is not valid for its option.
     */
    void overwriteConfigWithCommandLineInput(const std::map<std::string, std::string>& inputParams);

    /**
     * @brief Clears all options and set the default values
     */
    void clear() override;

    std::string toString() override;

  protected:
    void parseFromYAMLNode(const YAML::Node& config) override;
    void parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) override;

    /**
     * @brief Returns all options of this configuration.
     * Subclasses override this to expose their option members.
     * @return a vector of pointers to the options
     */
    virtual std::vector<BaseOption*> getOptions() = 0;

    /**
     * @brief Finds the option with the given identifier.
     * @param identifier name of the option
     * @return the option
     * @throws ConfigurationException if no option with this name exists.
     */
    BaseOption* getOption(const std::string& identifier);
};

}// namespace DFE::Configurations

#endif// DFE_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_
