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
#include <Configurations/ConfigurationException.hpp>
#include <Util/Logger/Logger.hpp>
#include <filesystem>
#include <sstream>
#include <utility>

namespace GTC::Configurations {

BaseConfiguration::BaseConfiguration(std::string name, std::string description)
    : name(std::move(name)), description(std::move(description)) {}

BaseOption* BaseConfiguration::findOption(const std::string& optionName) {
    for (auto* option : getOptions()) {
        if (option->getName() == optionName) {
            return option;
        }
    }
    return nullptr;
}

void BaseConfiguration::overwriteConfigWithYAMLFileInput(const std::string& filePath) {
    if (filePath.empty() || !std::filesystem::exists(filePath)) {
        throw ConfigurationException("Configuration file " + filePath + " does not exist.");
    }
    GTC_INFO2("BaseConfiguration: reading configuration from {}", filePath);
    YAML::Node config;
    try {
        config = YAML::LoadFile(filePath);
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("Cannot parse " + filePath + ": " + e.what());
    }
    if (!config.IsMap()) {
        // an empty file keeps all defaults
        return;
    }
    for (const auto& entry : config) {
        auto key = entry.first.as<std::string>();
        auto* option = findOption(key);
        if (option == nullptr) {
            throw ConfigurationException("Unknown configuration option " + key + " in " + filePath);
        }
        if (entry.second.IsNull()) {
            continue;
        }
        option->parseFromYAMLNode(entry.second);
    }
}

void BaseConfiguration::overwriteConfigWithCommandLineInput(const std::map<std::string, std::string>& inputParams) {
    std::map<std::string, std::string> params;
    for (const auto& [key, value] : inputParams) {
        auto nameStart = key.find_first_not_of('-');
        if (nameStart == std::string::npos || findOption(key.substr(nameStart)) == nullptr) {
            throw ConfigurationException("Unknown command line parameter " + key);
        }
        params[key.substr(nameStart)] = value;
    }
    for (auto* option : getOptions()) {
        option->parseFromString(option->getName(), params);
    }
}

void BaseConfiguration::clear() {
    for (auto* option : getOptions()) {
        option->clear();
    }
}

std::string BaseConfiguration::toString() {
    std::stringstream ss;
    ss << name << ": " << description << "\n";
    for (auto* option : getOptions()) {
        ss << option->toString() << "\n";
    }
    return ss.str();
}

}// namespace GTC::Configurations
