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

#ifndef GTC_COMMON_INCLUDE_CONFIGURATIONS_BASEOPTION_HPP_
#define GTC_COMMON_INCLUDE_CONFIGURATIONS_BASEOPTION_HPP_

#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

namespace GTC::Configurations {

/**
 * @brief Untyped base class of all configuration options.
 * An option knows its name and description and can parse its value from a YAML node or from a map of
 * command line parameters.
 */
class BaseOption {
  public:
    BaseOption() = default;
    BaseOption(std::string name, std::string description);
    virtual ~BaseOption() = default;

    /**
     * @brief Resets the option to its default value.
     */
    virtual void clear() = 0;

    [[nodiscard]] const std::string& getName() const;

    [[nodiscard]] const std::string& getDescription() const;

    virtual std::string toString() = 0;

  protected:
    friend class BaseConfiguration;

    /**
     * @brief Parses the value of this option from a YAML node.
     * @throws ConfigurationException if the node does not contain a valid value.
     */
    virtual void parseFromYAMLNode(const YAML::Node& node) = 0;

    /**
     * @brief Parses the value of this option from the command line parameter with the given identifier.
     * @throws ConfigurationException if the parameter does not contain a valid value.
     */
    virtual void parseFromString(const std::string& identifier, std::map<std::string, std::string>& inputParams) = 0;

    std::string name;
    std::string description;
};

}// namespace GTC::Configurations

#endif// GTC_COMMON_INCLUDE_CONFIGURATIONS_BASEOPTION_HPP_
