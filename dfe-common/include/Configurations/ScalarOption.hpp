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

#ifndef DFE_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_
#define DFE_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_

#include <Configurations/ConfigurationException.hpp>
#include <Configurations/TypedBaseOption.hpp>
#include <sstream>
#include <string>
#include <type_traits>

namespace DFE::Configurations {

/**
 * @brief This class defines an option with a single scalar value of type T, e.g., an integer, a boolean or a string.
 * @tparam T of the value.
 */
template<class T>
class ScalarOption : public TypedBaseOption<T> {
  public:
    /**
     * @brief Constructor to define a ScalarOption with a specific default value.
     * @param name of the ScalarOption.
     * @param defaultValue of the ScalarOption.
     * @param description of the ScalarOption.
     */
    ScalarOption(const std::string& name, T defaultValue, const std::string& description);

    /**
     * @brief Operator to assign a new value as a value of this option.
     * @param value that will be assigned
     * @return Reference to this option.
     */
    ScalarOption<T>& operator=(const T& value);

    std::string toString() override;

  protected:
    void parseFromYAMLNode(const YAML::Node& node) override;
    void parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) override;
};

template<class T>
ScalarOption<T>::ScalarOption(const std::string& name, T defaultValue, const std::string& description)
    : TypedBaseOption<T>(name, defaultValue, description) {}

template<class T>
ScalarOption<T>& ScalarOption<T>::operator=(const T& value) {
    this->value = value;
    return *this;
}

template<class T>
void ScalarOption<T>::parseFromYAMLNode(const YAML::Node& node) {
    if (!node.IsScalar()) {
        throw ConfigurationException("Option " + this->name + " expects a scalar value");
    }
    try {
        this->value = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("Value " + node.Scalar() + " is not valid for option " + this->name + ": " + e.what());
    }
}

template<class T>
void ScalarOption<T>::parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) {
    auto value = inputParams[identifier];
    if constexpr (std::is_same_v<T, std::string>) {
        this->value = value;
    } else {
        // reuse the YAML scalar conversion so that both inputs accept the same notation
        YAML::Node node(value);
        parseFromYAMLNode(node);
    }
}

template<class T>
std::string ScalarOption<T>::toString() {
    std::stringstream os;
    os << "Name: " << this->name << "\n";
    os << "Description: " << this->description << "\n";
    os << "Value: " << this->value << "\n";
    os << "Default Value: " << this->defaultValue << "\n";
    return os.str();
}

using StringOption = ScalarOption<std::string>;
using BoolOption = ScalarOption<bool>;
using UIntOption = ScalarOption<uint64_t>;
using FloatOption = ScalarOption<double>;

}// namespace DFE::Configurations

#endif// DFE_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_
