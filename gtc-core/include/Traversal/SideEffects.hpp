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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_SIDEEFFECTS_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_SIDEEFFECTS_HPP_

#include <Structure/Value.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace GTC {

class SideEffects;
using SideEffectsPtr = std::shared_ptr<SideEffects>;

/**
 * @brief Named bag of value lists shared by a root traversal and all of its children.
 * The bag is mutated while a traversal executes and is not synchronized.
 */
class SideEffects {
  public:
    static SideEffectsPtr create();

    /**
     * @brief Appends a value to the list stored under key.
     */
    void add(const std::string& key, Value value);

    /**
     * @brief Replaces the list stored under key.
     */
    void set(const std::string& key, std::vector<Value> values);

    /**
     * @brief Returns the list stored under key, an empty list if the key is unknown.
     */
    [[nodiscard]] const std::vector<Value>& get(const std::string& key) const;

    [[nodiscard]] bool exists(const std::string& key) const;

    [[nodiscard]] std::set<std::string> keys() const;

    [[nodiscard]] bool isEmpty() const;

    void remove(const std::string& key);

    /**
     * @brief Creates an independent copy of this bag.
     */
    [[nodiscard]] SideEffectsPtr copy() const;

    std::string toString() const;

  private:
    std::map<std::string, std::vector<Value>> values;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_SIDEEFFECTS_HPP_
