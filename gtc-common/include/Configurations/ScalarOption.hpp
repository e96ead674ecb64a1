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

#ifndef GTC_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_
#define GTC_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_

#include <Configurations/ConfigurationException.hpp>
#include <Configurations/TypedBaseOption.hpp>
#include <sstream>
#include <string>

namespace GTC::Configurations {

/**
 * @brief This class defines an option with a single value of a primitive type, e.g. bool, int64_t or std::string.
 * @tparam T type of the option value
 */
template<class T>
class ScalarOption : public TypedBaseOption<T> {
  public:
    ScalarOption(const std::string& name, T defaultValue, const std::string& description)
        : TypedBaseOption<T>(name, defaultValue, description) {}

    ScalarOption<T>& operator=(const T& newValue) {
        this->value = newValue;
        return *this;
    }

    std::string toString() override {
        std::stringstream os;
        os << std::boolalpha << "Name: " << this->name << "\n";
        os << "Description: " << this->description << "\n";
        os << "Value: " << this->value << "\n";
        os << "Default Value: " << this->defaultValue << "\n";
        return os.str();
    }

  protected:
    void parseFromYAMLNode(const YAML::Node& node) override {
        try {
            this->value = node.as<T>();
        } catch (const YAML::Exception& e) {
            throw ConfigurationException("Invalid value for " + this->name + ": " + e.what());
        }
    }

    void parseFromString(const std::string& identifier, std::map<std::string, std::string>& inputParams) override {
        auto found = inputParams.find(identifier);
        if (found == inputParams.end()) {
            return;
        }
        // yaml-cpp gives us the same scalar conversion rules for both input channels
        parseFromYAMLNode(YAML::Node(found->second));
    }
};

using BoolOption = ScalarOption<bool>;
using IntOption = ScalarOption<int64_t>;
using StringOption = ScalarOption<std::string>;

}// namespace GTC::Configurations

#endif// GTC_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_
