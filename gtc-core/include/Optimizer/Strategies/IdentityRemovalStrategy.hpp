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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_IDENTITYREMOVALSTRATEGY_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_IDENTITYREMOVALSTRATEGY_HPP_

#include <Optimizer/TraversalStrategy.hpp>

namespace GTC::Optimizer {

class IdentityRemovalStrategy;
using IdentityRemovalStrategyPtr = std::shared_ptr<const IdentityRemovalStrategy>;

/**
 * @brief Removes identity steps from a traversal.
 *
 * Example: V().identity().out() becomes V().out()
 *
 * Labels of a removed identity step move to its predecessor. An identity step without a predecessor that carries labels
 * is kept, as it is the only position the labels can be bound to. A traversal that consists of a single step is left
 * untouched.
 */
class IdentityRemovalStrategy : public TraversalStrategy {
  public:
    static IdentityRemovalStrategyPtr instance();

    void apply(const TraversalPtr& traversal) const override;

    [[nodiscard]] std::string getName() const override;

    [[nodiscard]] StrategyCategory getCategory() const override;

  private:
    IdentityRemovalStrategy() = default;
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_IDENTITYREMOVALSTRATEGY_HPP_
