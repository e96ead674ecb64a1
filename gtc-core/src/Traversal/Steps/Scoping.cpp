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

#include <Traversal/Steps/Scoping.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

std::optional<Value> Scoping::getScopeValue(Pop pop, const std::string& key, const TraverserPtr& traverser) {
    auto pathValue = traverser->getPath().get(pop, key);
    if (pathValue.has_value()) {
        return pathValue;
    }
    const auto& sideEffects = traverser->getSideEffects();
    if (sideEffects != nullptr && sideEffects->exists(key)) {
        const auto& values = sideEffects->get(key);
        if (!values.empty()) {
            return pop == Pop::FIRST ? values.front() : values.back();
        }
    }
    return std::nullopt;
}

}// namespace GTC
