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

#ifndef DFE_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_
#define DFE_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_

#include <Configurations/BaseOption.hpp>

namespace DFE::Configurations {

/**
 * @brief This class is the basis of all option that have a specific value type.
 * @tparam T of the value.
 */
template<class T>
class TypedBaseOption : public BaseOption {
  public:
    /**
     * @brief Constructor to create a new option without a default value.
     * @param name of the option.
     * @param description of the option.
     */
    TypedBaseOption(const std::string& name, const std::string& description);

    /**
     * @brief Constructor to create a new option that sets a default value.
     * @param name of the option.
     * @param defaultValue of the option.
     * @param description of the option.
     */
    TypedBaseOption(const std::string& name, T defaultValue, const std::string& description);

    /**
     * @brief Operator to directly access the value of this option.
     * @return Returns an object of the option type T.
     */
    operator T() const { return this->value; }

    /**
     * @brief Clears the option and sets the value to the default value.
     */
    void clear() override;

    /**
     * @brief Getter to access the value of the option.
     * @return Returns an object of the option type T.
     */
    [[nodiscard]] T getValue() const;

    /**
     * @brief Setter to set the value of the option.
     * @param newValue
     */
    void setValue(T newValue);

    /**
     * @brief Getter to access the default value of this option.
     * @return default value
     */
    [[nodiscard]] const T& getDefaultValue() const;

  protected:
    T value;
    T defaultValue;
};

template<class T>
TypedBaseOption<T>::TypedBaseOption(const std::string& name, const std::string& description)
    : BaseOption(name, description), value(), defaultValue() {}

template<class T>
TypedBaseOption<T>::TypedBaseOption(const std::string& name, T defaultValue, const std::string& description)
    : BaseOption(name, description), value(defaultValue), defaultValue(defaultValue) {}

template<class T>
T TypedBaseOption<T>::getValue() const {
    return value;
};

template<class T>
void TypedBaseOption<T>::setValue(T newValue) {
    this->value = newValue;
}

template<class T>
const T& TypedBaseOption<T>::getDefaultValue() const {
    return defaultValue;
}

template<class T>
void TypedBaseOption<T>::clear() {
    this->value = defaultValue;
}

}// namespace DFE::Configurations

#endif// DFE_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_
