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

#ifndef GTC_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_
#define GTC_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_

#include <Configurations/BaseOption.hpp>
#include <Configurations/EnumOption.hpp>
#include <Configurations/ScalarOption.hpp>
#include <map>
#include <string>
#include <vector>

namespace GTC::Configurations {

/**
 * @brief Base class of a configuration, i.e., a named collection of options.
 * Sub classes expose their options as public members and list them in getOptions().
 */
class BaseConfiguration {
  public:
    BaseConfiguration() = default;
    BaseConfiguration(std::string name, std::string description);
    virtual ~BaseConfiguration() = default;

    /**
     * @brief Overwrites the option values with the values of a YAML file. Options missing in the file keep their value.
     * @param filePath path to the yaml file
     * @throws ConfigurationException if the file cannot be read or contains an unknown option
     */
    void overwriteConfigWithYAMLFileInput(const std::string& filePath);

    /**
     * @brief Overwrites the option values with command line parameters of the form --name=value.
     * @param inputParams map of parameter name (with leading dashes) to value
     * @throws ConfigurationException if a parameter does not belong to an option
     */
    void overwriteConfigWithCommandLineInput(const std::map<std::string, std::string>& inputParams);

    /**
     * @brief Resets all options to their default values.
     */
    void clear();

    std::string toString();

  protected:
    virtual std::vector<BaseOption*> getOptions() = 0;

  private:
    BaseOption* findOption(const std::string& optionName);

    std::string name;
    std::string description;
};

}// namespace GTC::Configurations

#endif// GTC_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_
