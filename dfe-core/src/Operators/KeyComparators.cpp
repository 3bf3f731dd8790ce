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

#include <Operators/KeyComparators.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE {

KeyComparatorsPtr KeyComparators::create() { return std::make_shared<KeyComparators>(); }

void KeyComparators::registerComparator(std::type_index keyType, KeyComparator comparator) {
    DFE_DEBUG("KeyComparators: register comparator for " << keyType.name());
    comparators.insert_or_assign(keyType, std::move(comparator));
}

bool KeyComparators::hasComparator(std::type_index keyType) const { return comparators.contains(keyType); }

const KeyComparator& KeyComparators::getComparator(std::type_index keyType) const {
    auto it = comparators.find(keyType);
    if (it == comparators.end()) {
        DFE_THROW_RUNTIME_ERROR("KeyComparators: no comparator registered for " << keyType.name());
    }
    return it->second;
}

}// namespace DFE
