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

#include <Configurations/EngineConfiguration.hpp>
#include <Util/Logger/Logger.hpp>
#include <map>

namespace DFE::Configurations {

EngineConfigurationPtr EngineConfiguration::create(int argc, const char** argv) {
    std::map<std::string, std::string> commandLineParams;
    for (int i = 1; i < argc; ++i) {
        std::string argument = argv[i];
        auto separator = argument.find('=');
        if (separator == std::string::npos) {
            throw ConfigurationException("Argument " + argument + " does not have the form --name=value");
        }
        commandLineParams.insert_or_assign(argument.substr(0, separator), argument.substr(separator + 1));
    }

    auto configuration = create();
    auto configPath = commandLineParams.find("--" + CONFIG_PATH);
    if (configPath != commandLineParams.end()) {
        DFE_INFO("EngineConfiguration: load configuration from " << configPath->second);
        configuration->overwriteConfigWithYAMLFileInput(configPath->second);
        commandLineParams.erase(configPath);
    }
    configuration->overwriteConfigWithCommandLineInput(commandLineParams);
    return configuration;
}

}// namespace DFE::Configurations
