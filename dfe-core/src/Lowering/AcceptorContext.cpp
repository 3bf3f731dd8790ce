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

#include <Lowering/AcceptorContext.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE::Lowering {

AcceptorContext::AcceptorContext(KeyComparatorsPtr comparators, uint64_t broadcastJoinThreshold)
    : comparators(std::move(comparators)), broadcastJoinThreshold(broadcastJoinThreshold) {
    DFE_ASSERT(this->comparators, "AcceptorContext requires a comparator registry");
}

AcceptorContextPtr AcceptorContext::create(KeyComparatorsPtr comparators, uint64_t broadcastJoinThreshold) {
    return std::make_shared<AcceptorContext>(std::move(comparators), broadcastJoinThreshold);
}

AcceptorContextPtr AcceptorContext::create(const Configurations::EngineConfigurationPtr& configuration,
                                           KeyComparatorsPtr comparators) {
    return create(std::move(comparators), configuration->broadcastJoinThreshold.getValue());
}

}// namespace DFE::Lowering
