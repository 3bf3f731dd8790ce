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

#ifndef DFE_CORE_INCLUDE_STATE_STATEDESCRIPTOR_HPP_
#define DFE_CORE_INCLUDE_STATE_STATEDESCRIPTOR_HPP_

#include <State/StateSerde.hpp>
#include <any>
#include <functional>

namespace DFE::State {

/**
 * @brief Describes the accumulators kept by a keyed state store.
 */
struct StateDescriptor {
    // encodes keys, the encoded bytes identify a key
    StateSerdePtr keySerde;
    // encodes accumulators when they are spilled
    StateSerdePtr accumulatorSerde;
    // creates the accumulator of a new entry
    std::function<std::any()> createAccumulator;
    // combines two accumulators of the same key when their windows are merged
    std::function<std::any(const std::any&, const std::any&)> combine;
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_STATEDESCRIPTOR_HPP_
