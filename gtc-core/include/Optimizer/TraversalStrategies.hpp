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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_TRAVERSALSTRATEGIES_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_TRAVERSALSTRATEGIES_HPP_

#include <Optimizer/TraversalStrategy.hpp>
#include <Traversal/TraversalForwardRefs.hpp>
#include <set>
#include <string>
#include <vector>

namespace GTC::Configurations {
class CompilerConfiguration;
}// namespace GTC::Configurations

namespace GTC::Optimizer {

/**
 * @brief An immutable, ordered set of strategies.
 * Strategies are ordered by category first (decoration, optimization, provider optimization, finalization,
 * verification). Within a category the order is a topological sort of the declared applyPrior/applyPost
 * dependencies, ties are broken by name so the order does not depend on the order of registration.
 * Dependencies on strategies that are not part of the set are ignored.
 */
class TraversalStrategies {
  public:
    /**
     * @brief Creates an ordered strategy set. A strategy replaces an earlier one with the same name.
     * @param strategies the strategies in any order
     * @param verifyInvariants checks the pipeline invariants after every strategy
     * @throws TraversalConstructionException if the dependencies form a cycle or cross a category
     */
    static TraversalStrategiesPtr create(const std::vector<TraversalStrategyPtr>& strategies, bool verifyInvariants = true);

    /**
     * @brief Creates the default strategies minus the strategies excluded by the configuration.
     * @throws ConfigurationException if an excluded strategy is unknown
     */
    static TraversalStrategiesPtr create(const Configurations::CompilerConfiguration& configuration);

    /**
     * @brief Returns the process wide default strategy set.
     */
    static TraversalStrategiesPtr getDefaultStrategies();

    static std::vector<TraversalStrategyPtr> getDefaultStrategyList();

    /**
     * @brief Returns a new set containing this set and the given strategies.
     * @throws TraversalConstructionException if the dependencies form a cycle or cross a category
     */
    [[nodiscard]] TraversalStrategiesPtr addStrategies(const std::vector<TraversalStrategyPtr>& strategiesToAdd) const;

    /**
     * @brief Returns a new set without the strategies of the given names.
     */
    [[nodiscard]] TraversalStrategiesPtr removeStrategies(const std::set<std::string>& names) const;

    /**
     * @brief Returns the strategies in application order.
     */
    [[nodiscard]] const std::vector<TraversalStrategyPtr>& getStrategies() const;

    [[nodiscard]] bool isVerifyingInvariants() const;

    /**
     * @brief Compiles the traversal: every strategy is applied to the traversal and all of its children in breadth-first
     * order, the requirements are recomputed after every strategy, and finally the traversal is locked.
     * A locked traversal is left untouched.
     * @throws InvariantViolationException if a strategy breaks the pipeline invariants and verification is enabled
     * @throws VerificationException if a verification strategy rejects the traversal
     */
    void applyStrategies(const TraversalPtr& traversal) const;

    [[nodiscard]] std::string toString() const;

  private:
    TraversalStrategies(std::vector<TraversalStrategyPtr> strategies, bool verifyInvariants);

    static std::vector<TraversalStrategyPtr> sortStrategies(const std::vector<TraversalStrategyPtr>& strategies);

    std::vector<TraversalStrategyPtr> strategies;
    bool verifyInvariants;
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_TRAVERSALSTRATEGIES_HPP_
