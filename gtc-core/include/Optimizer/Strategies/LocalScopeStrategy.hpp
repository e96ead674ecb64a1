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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_LOCALSCOPESTRATEGY_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_LOCALSCOPESTRATEGY_HPP_

#include <Optimizer/TraversalStrategy.hpp>

namespace GTC::Optimizer {

class LocalScopeStrategy;
using LocalScopeStrategyPtr = std::shared_ptr<const LocalScopeStrategy>;

/**
 * @brief Switches global where()-filters to local scope if none of their scope keys is a step label of the root
 * traversal. Such a filter can only bind its keys through side effects, so the traversers do not need a path.
 */
class LocalScopeStrategy : public TraversalStrategy {
  public:
    static LocalScopeStrategyPtr instance();

    void apply(const TraversalPtr& traversal) const override;

    [[nodiscard]] std::string getName() const override;

    [[nodiscard]] StrategyCategory getCategory() const override;

    [[nodiscard]] std::set<std::string> applyPrior() const override;

  private:
    LocalScopeStrategy() = default;
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_LOCALSCOPESTRATEGY_HPP_
