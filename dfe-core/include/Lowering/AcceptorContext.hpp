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

#ifndef DFE_CORE_INCLUDE_LOWERING_ACCEPTORCONTEXT_HPP_
#define DFE_CORE_INCLUDE_LOWERING_ACCEPTORCONTEXT_HPP_

#include <Configurations/EngineConfiguration.hpp>
#include <Operators/KeyComparators.hpp>
#include <cstdint>
#include <memory>
#include <typeindex>

namespace DFE::Lowering {

class AcceptorContext;
using AcceptorContextPtr = std::shared_ptr<AcceptorContext>;

/**
 * @brief Read-only information the acceptance predicates of translation rules can use.
 */
class AcceptorContext {
  public:
    AcceptorContext(KeyComparatorsPtr comparators, uint64_t broadcastJoinThreshold);

    static AcceptorContextPtr create(KeyComparatorsPtr comparators, uint64_t broadcastJoinThreshold);

    static AcceptorContextPtr create(const Configurations::EngineConfigurationPtr& configuration, KeyComparatorsPtr comparators);

    [[nodiscard]] bool hasComparator(std::type_index keyType) const { return comparators->hasComparator(keyType); }

    [[nodiscard]] const KeyComparatorsPtr& getComparators() const { return comparators; }

    [[nodiscard]] uint64_t getBroadcastJoinThreshold() const { return broadcastJoinThreshold; }

  private:
    KeyComparatorsPtr comparators;
    uint64_t broadcastJoinThreshold;
};

}// namespace DFE::Lowering

#endif// DFE_CORE_INCLUDE_LOWERING_ACCEPTORCONTEXT_HPP_
