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

#ifndef DFE_CORE_INCLUDE_OPERATORS_KEYCOMPARATORS_HPP_
#define DFE_CORE_INCLUDE_OPERATORS_KEYCOMPARATORS_HPP_

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <typeindex>

namespace DFE {

/**
 * @brief Strict weak ordering of two keys of the same type.
 */
using KeyComparator = std::function<bool(const std::any& left, const std::any& right)>;

class KeyComparators;
using KeyComparatorsPtr = std::shared_ptr<KeyComparators>;

/**
 * @brief Registry of key comparators by key type.
 * Strategies that sort keys, e.g., the sort merge join, are only applicable for registered key types.
 */
class KeyComparators {
  public:
    static KeyComparatorsPtr create();

    void registerComparator(std::type_index keyType, KeyComparator comparator);

    /**
     * @brief Registers operator< of KeyType.
     */
    template<class KeyType>
    void registerComparator() {
        registerComparator(typeid(KeyType), [](const std::any& left, const std::any& right) {
            return std::any_cast<const KeyType&>(left) < std::any_cast<const KeyType&>(right);
        });
    }

    [[nodiscard]] bool hasComparator(std::type_index keyType) const;

    /**
     * @brief Returns the comparator of a key type.
     * @throws RuntimeException if no comparator is registered for the type
     */
    [[nodiscard]] const KeyComparator& getComparator(std::type_index keyType) const;

  private:
    std::map<std::type_index, KeyComparator> comparators;
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_OPERATORS_KEYCOMPARATORS_HPP_
