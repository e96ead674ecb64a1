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

#ifndef GTC_COMMON_INCLUDE_CONFIGURATIONS_ENUMOPTION_HPP_
#define GTC_COMMON_INCLUDE_CONFIGURATIONS_ENUMOPTION_HPP_
#include <Configurations/ConfigurationException.hpp>
#include <Configurations/TypedBaseOption.hpp>
#include <magic_enum.hpp>
#include <string>
#include <type_traits>

namespace GTC::Configurations {

/**
 * @brief Option whose value is a member of an enum. Values are read by enumerator name, e.g. LOG_DEBUG.
 */
template<class EnumType>
    requires std::is_enum_v<EnumType>
class EnumOption : public TypedBaseOption<EnumType> {
  public:
    EnumOption(const std::string& name, EnumType defaultValue, const std::string& description)
        : TypedBaseOption<EnumType>(name, defaultValue, description) {}

    EnumOption<EnumType>& operator=(EnumType newValue) {
        this->value = newValue;
        return *this;
    }

    std::string toString() override {
        return this->name + ": " + std::string(magic_enum::enum_name(this->value)) + " (default "
            + std::string(magic_enum::enum_name(this->defaultValue)) + ")";
    }

  protected:
    void parseFromYAMLNode(const YAML::Node& node) override {
        if (!node.IsScalar()) {
            throw ConfigurationException("Option " + this->name + " expects an enumerator name");
        }
        assign(node.Scalar());
    }

    void parseFromString(const std::string& identifier, std::map<std::string, std::string>& inputParams) override {
        if (auto found = inputParams.find(identifier); found != inputParams.end()) {
            assign(found->second);
        }
    }

  private:
    void assign(const std::string& enumeratorName) {
        auto parsed = magic_enum::enum_cast<EnumType>(enumeratorName);
        if (!parsed.has_value()) {
            std::string known;
            for (auto enumerator : magic_enum::enum_names<EnumType>()) {
                known += (known.empty() ? "" : ", ") + std::string(enumerator);
            }
            throw ConfigurationException(enumeratorName + " is not a valid value of " + this->name + ", expected one of "
                                         + known);
        }
        this->value = parsed.value();
    }
};

}// namespace GTC::Configurations

#endif// GTC_COMMON_INCLUDE_CONFIGURATIONS_ENUMOPTION_HPP_
