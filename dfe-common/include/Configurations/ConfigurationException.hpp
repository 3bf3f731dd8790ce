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

#ifndef DFE_COMMON_INCLUDE_CONFIGURATIONS_CONFIGURATIONEXCEPTION_HPP_
#define DFE_COMMON_INCLUDE_CONFIGURATIONS_CONFIGURATIONEXCEPTION_HPP_

#include <Exceptions/RuntimeException.hpp>
#include <string>

namespace DFE::Configurations {

/**
 * @brief This exception is thrown if an option or a configuration file could not be parsed.
 */
class ConfigurationException : public Exceptions::RuntimeException {
  public:
    explicit ConfigurationException(const std::string& message,
                                    const std::source_location location = std::source_location::current())
        : RuntimeException("ConfigurationException: " + message, location) {}
};

}// namespace DFE::Configurations

#endif// DFE_COMMON_INCLUDE_CONFIGURATIONS_CONFIGURATIONEXCEPTION_HPP_
