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

#include <Traversal/SideEffects.hpp>
#include <sstream>

namespace GTC {

SideEffectsPtr SideEffects::create() { return std::make_shared<SideEffects>(); }

void SideEffects::add(const std::string& key, Value value) { values[key].emplace_back(std::move(value)); }

void SideEffects::set(const std::string& key, std::vector<Value> newValues) { values[key] = std::move(newValues); }

const std::vector<Value>& SideEffects::get(const std::string& key) const {
    static const std::vector<Value> empty{};
    auto found = values.find(key);
    if (found == values.end()) {
        return empty;
    }
    return found->second;
}

bool SideEffects::exists(const std::string& key) const { return values.contains(key); }

std::set<std::string> SideEffects::keys() const {
    std::set<std::string> result;
    for (const auto& [key, ignored] : values) {
        result.insert(key);
    }
    return result;
}

bool SideEffects::isEmpty() const { return values.empty(); }

void SideEffects::remove(const std::string& key) { values.erase(key); }

SideEffectsPtr SideEffects::copy() const {
    auto copy = create();
    copy->values = values;
    return copy;
}

std::string SideEffects::toString() const {
    std::stringstream ss;
    ss << "sideEffects[size:" << values.size() << "]";
    return ss.str();
}

}// namespace GTC
