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

#ifndef DFE_CORE_INCLUDE_STATE_STATEKEY_HPP_
#define DFE_CORE_INCLUDE_STATE_STATEKEY_HPP_

#include <Windowing/Window.hpp>
#include <functional>
#include <string>

namespace DFE::State {

/**
 * @brief Identity of a keyed state entry: the encoded key and the window it belongs to.
 */
struct StateKey {
    std::string keyBytes;
    Windowing::Window window;

    bool operator==(const StateKey& other) const = default;
};

struct StateKeyHash {
    size_t operator()(const StateKey& stateKey) const noexcept {
        auto h1 = std::hash<std::string>{}(stateKey.keyBytes);
        auto h2 = std::hash<Windowing::Window>{}(stateKey.window);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}// namespace DFE::State

#endif// DFE_CORE_INCLUDE_STATE_STATEKEY_HPP_
