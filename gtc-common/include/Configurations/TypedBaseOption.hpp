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

#ifndef GTC_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_
#define GTC_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_

#include <Configurations/BaseOption.hpp>

namespace GTC::Configurations {

/**
 * @brief Base class of options holding a value of type T next to its default value.
 * @tparam T type of the option value
 */
template<class T>
class TypedBaseOption : public BaseOption {
  public:
    TypedBaseOption(const std::string& name, T defaultValue, const std::string& description)
        : BaseOption(name, description), value(defaultValue), defaultValue(defaultValue) {}

    operator T() const { return value; }

    [[nodiscard]] T getValue() const { return value; };

    [[nodiscard]] T getDefaultValue() const { return defaultValue; }

    void setValue(T newValue) { this->value = newValue; }

    void clear() override { value = defaultValue; }

  protected:
    T value;
    const T defaultValue;
};

}// namespace GTC::Configurations

#endif// GTC_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_
