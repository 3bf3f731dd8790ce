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

#include <Configurations/BaseConfiguration.hpp>
#include <Util/Logger/Logger.hpp>
#include <filesystem>

namespace DFE::Configurations {

BaseConfiguration::BaseConfiguration() : BaseOption(){};

BaseConfiguration::BaseConfiguration(const std::string& name, const std::string& description) : BaseOption(name, description){};

void BaseConfiguration::parseFromYAMLNode(const YAML::Node& config) {
    if (!config.IsMap()) {
        throw ConfigurationException("Configuration " + name + " expects a map of options");
    }
    for (const auto& entry : config) {
        auto identifier = entry.first.as<std::string>();
        if (entry.second.IsNull()) {
            DFE_WARNING2("Option {} of configuration {} is empty and keeps its current value", identifier, name);
            continue;
        }
        getOption(identifier)->parseFromYAMLNode(entry.second);
    }
}

void BaseConfiguration::parseFromString(std::string identifier, std::map<std::string, std::string>&) {
    throw ConfigurationException("Configuration " + identifier + " cannot be set from a single value");
}

void BaseConfiguration::overwriteConfigWithYAMLFileInput(const std::string& filePath) {
    if (filePath.empty() || !std::filesystem::exists(filePath)) {
        throw ConfigurationException("Configuration file " + filePath + " does not exist");
    }
    DFE_INFO2("Loading configuration {} from {}", name, filePath);
    YAML::Node config;
    try {
        config = YAML::LoadFile(filePath);
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("Configuration file " + filePath + " is not valid YAML: " + e.what());
    }
    if (config.IsNull()) {
        DFE_WARNING2("Configuration file {} is empty", filePath);
        return;
    }
    parseFromYAMLNode(config);
}

void BaseConfiguration::overwriteConfigWithCommandLineInput(const std::map<std::string, std::string>& inputParams) {
    std::map<std::string, std::string> params;
    for (const auto& [key, value] : inputParams) {
        auto identifier = key.starts_with("--") ? key.substr(2) : key;
        params[identifier] = value;
    }
    for (const auto& [identifier, value] : params) {
        DFE_DEBUG2("Setting option {} of configuration {} to {}", identifier, name, value);
        getOption(identifier)->parseFromString(identifier, params);
    }
}

BaseOption* BaseConfiguration::getOption(const std::string& identifier) {
    for (auto* option : getOptions()) {
        if (option->getName() == identifier) {
            return option;
        }
    }
    throw ConfigurationException("Identifier " + identifier + " is not known by configuration " + name);
}

void BaseConfiguration::clear() {
    for (auto* option : getOptions()) {
        option->clear();
    }
}

std::string BaseConfiguration::toString() {
    std::stringstream ss;
    for (auto* option : getOptions()) {
        ss << option->toString() << "\n";
    }
    return ss.str();
}

}// namespace DFE::Configurations
