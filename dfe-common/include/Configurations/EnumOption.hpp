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

#ifndef DFE_COMMON_INCLUDE_CONFIGURATIONS_ENUMOPTION_HPP_
#define DFE_COMMON_INCLUDE_CONFIGURATIONS_ENUMOPTION_HPP_
#include <Configurations/ConfigurationException.hpp>
#include <Configurations/TypedBaseOption.hpp>
#include <magic_enum.hpp>
#include <string>
#include <type_traits>

namespace DFE::Configurations {
/**
 * @brief This class defines an option, which has only the member of an enum as possible values.
 * @tparam EnumType
 */
template<class EnumType>
requires std::is_enum<EnumType>::value class EnumOption : public TypedBaseOption<EnumType> {
  public:
    /**
     * @brief Constructor to define a EnumOption with a specific default value.
     * @param name of the EnumOption.
     * @param defaultValue of the EnumOption, has to be an member of the EnumType.
     * @param description of the EnumOption.
     */
    EnumOption(const std::string& name, EnumType defaultValue, const std::string& description);

    /**
     * @brief Operator to assign a new value as a value of this option.
     * @param value that will be assigned
     * @return Reference to this option.
     */
    EnumOption<EnumType>& operator=(const EnumType& value);
    std::string toString() override;

  protected:
    void parseFromYAMLNode(const YAML::Node& node) override;
    void parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) override;

  private:
    void parseFromName(const std::string& enumName);
    static std::string validNames();
};

template<class EnumType>
requires std::is_enum<EnumType>::value
EnumOption<EnumType>::EnumOption(const std::string& name, EnumType defaultValue, const std::string& description)
    : TypedBaseOption<EnumType>(name, defaultValue, description){};

template<class EnumType>
requires std::is_enum<EnumType>::value EnumOption<EnumType>& EnumOption<EnumType>::operator=(const EnumType& value) {
    this->value = value;
    return *this;
}

template<class EnumType>
requires std::is_enum<EnumType>::value void EnumOption<EnumType>::parseFromYAMLNode(const YAML::Node& node) {
    if (!node.IsScalar()) {
        throw ConfigurationException("Option " + this->name + " expects one of " + validNames());
    }
    parseFromName(node.Scalar());
}

template<class EnumType>
requires std::is_enum<EnumType>::value void
EnumOption<EnumType>::parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) {
    parseFromName(inputParams[identifier]);
}

template<class EnumType>
requires std::is_enum<EnumType>::value void EnumOption<EnumType>::parseFromName(const std::string& enumName) {
    // Check if the value is a member of this enum type.
    auto parsed = magic_enum::enum_cast<EnumType>(enumName);
    if (!parsed.has_value()) {
        throw ConfigurationException("Enum for " + enumName + " was not found. Valid options are " + validNames());
    }
    this->value = parsed.value();
}

template<class EnumType>
requires std::is_enum<EnumType>::value std::string EnumOption<EnumType>::validNames() {
    std::string names;
    for (auto enumName : magic_enum::enum_names<EnumType>()) {
        if (!names.empty()) {
            names.append(", ");
        }
        names.append(enumName);
    }
    return names;
}

template<class EnumType>
requires std::is_enum<EnumType>::value std::string EnumOption<EnumType>::toString() {
    std::string out = "Name: " + this->name + "\n";
    out.append("Description: " + this->description + "\n");
    out.append("Value: " + std::string(magic_enum::enum_name(this->value)) + "\n");
    out.append("Default Value: " + std::string(magic_enum::enum_name(this->defaultValue)) + "\n");
    return out;
}

}// namespace DFE::Configurations

#endif// DFE_COMMON_INCLUDE_CONFIGURATIONS_ENUMOPTION_HPP_
