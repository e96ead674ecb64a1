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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SCOPING_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SCOPING_HPP_

#include <Structure/Value.hpp>
#include <Traversal/Scope.hpp>
#include <Traversal/TraversalForwardRefs.hpp>
#include <optional>
#include <set>
#include <string>

namespace GTC {

/**
 * @brief Mixin of steps that reference labels bound elsewhere in the enclosing traversal.
 */
class Scoping {
  public:
    virtual ~Scoping() = default;

    /**
     * @brief Returns the labels this step depends on.
     */
    [[nodiscard]] virtual std::set<std::string> getScopeKeys() const = 0;

    [[nodiscard]] virtual Scope getScope() const = 0;

    /**
     * @brief Changes the scope of the step. Steps with a scope fixed at construction ignore the call.
     */
    virtual void setScope(Scope scope) = 0;

    /**
     * @brief Resolves the value bound to key for the traverser.
     * The path of the traverser is searched first, then the side-effect bag.
     * @param pop FIRST or LAST binding if the key is bound more than once
     * @param key the label
     * @param traverser the traverser
     * @return the bound value or nullopt if the key is not bound
     */
    static std::optional<Value> getScopeValue(Pop pop, const std::string& key, const TraverserPtr& traverser);
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SCOPING_HPP_
