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

#ifndef DFE_COMMON_INCLUDE_CONFIGURATIONS_BASEOPTION_HPP_
#define DFE_COMMON_INCLUDE_CONFIGURATIONS_BASEOPTION_HPP_

#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

namespace DFE::Configurations {

/**
 * @brief This class is the basis of all option.
 * All option can define a name and a description.
 */
class BaseOption {
  public:
    BaseOption() = default;

    /**
     * @brief Constructor to create a new option.
     * @param name of the option.
     * @param description of the option.
     */
    BaseOption(const std::string& name, const std::string& description);

    virtual ~BaseOption() = default;

    /**
     * @brief Clears the option and sets a default value if available.
     */
    virtual void clear() = 0;

    /**
     * @brief Checks if the option is equal to another option.
     * @param other option.
     * @return true if the option is equal.
     */
    virtual bool operator==(const BaseOption& other);

    /**
     * @brief Getter to access the name of a option.
     * @return name of the option.
     */
    std::string getName();

    /**
     * @brief Getter to access the description of a option.
     * @return description of the option.
     */
    std::string getDescription();

    virtual std::string toString() = 0;

  protected:
    friend class BaseConfiguration;

    /**
     * @brief ParseFromYamlNode fills the content of this option with the value of the YAML node.
     * If the node is not compatible with this option a ConfigurationException is thrown.
     * @param node the YAML node
     */
    virtual void parseFromYAMLNode(const YAML::Node& node) = 0;

    /**
     * @brief ParseFromString fills the content of this option with the value behind identifier in inputParams.
     * If the value is not compatible with this option a ConfigurationException is thrown.
     * @param identifier of the option
     * @param inputParams map of option identifiers to values
     */
    virtual void parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) = 0;

    std::string name;
    std::string description;
};

}// namespace DFE::Configurations

#endif// DFE_COMMON_INCLUDE_CONFIGURATIONS_BASEOPTION_HPP_
