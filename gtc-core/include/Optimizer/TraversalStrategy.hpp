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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_TRAVERSALSTRATEGY_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_TRAVERSALSTRATEGY_HPP_

#include <Traversal/TraversalForwardRefs.hpp>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace GTC::Optimizer {

/**
 * @brief Categories of strategies, applied in the order of declaration.
 */
enum class StrategyCategory : uint8_t {
    // adds application level steps, e.g., for security or partitioning
    DECORATION,
    // rewrites the traversal into a cheaper but equivalent one
    OPTIMIZATION,
    // rewrites that exploit properties of the storage backend
    PROVIDER_OPTIMIZATION,
    // last structural changes before execution
    FINALIZATION,
    // rejects traversals that cannot legally run, no changes
    VERIFICATION
};

/**
 * @brief A rewrite pass over a traversal.
 * Strategies are stateless singletons: apply only mutates the traversal it is given, so one strategy may be applied to
 * independent traversals concurrently.
 */
class TraversalStrategy {
  public:
    virtual ~TraversalStrategy() = default;

    /**
     * @brief Rewrites the traversal in place. The traversal may be a root or a child traversal.
     * @param traversal the traversal to rewrite
     */
    virtual void apply(const TraversalPtr& traversal) const = 0;

    /**
     * @brief Unique name of the strategy, used to declare ordering dependencies and to exclude strategies by configuration.
     */
    [[nodiscard]] virtual std::string getName() const = 0;

    [[nodiscard]] virtual StrategyCategory getCategory() const = 0;

    /**
     * @brief Names of strategies of the same category that have to be applied before this strategy.
     */
    [[nodiscard]] virtual std::set<std::string> applyPrior() const;

    /**
     * @brief Names of strategies of the same category that have to be applied after this strategy.
     */
    [[nodiscard]] virtual std::set<std::string> applyPost() const;

    [[nodiscard]] std::string toString() const;

    /**
     * @brief Checks if the strategy is an instance of T.
     */
    template<class T>
    [[nodiscard]] bool instanceOf() const {
        return dynamic_cast<const T*>(this) != nullptr;
    }
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_TRAVERSALSTRATEGY_HPP_
