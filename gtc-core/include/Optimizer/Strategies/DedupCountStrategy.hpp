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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_DEDUPCOUNTSTRATEGY_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_DEDUPCOUNTSTRATEGY_HPP_

#include <Optimizer/TraversalStrategy.hpp>

namespace GTC::Optimizer {

class DedupCountStrategy;
using DedupCountStrategyPtr = std::shared_ptr<const DedupCountStrategy>;

/**
 * @brief Fuses a dedup() directly followed by a count() into a single distinct count step.
 *
 * Example: V().out().dedup().count() becomes V().out().dedupCount()
 *
 * The fusion only pays off on the graph computer, where the dedup would otherwise ship every distinct value to a
 * single worker before counting. It is applied to global children (including the root) only, as a local child is
 * evaluated per traverser. A labelled dedup step is kept because its output is observable through the label.
 */
class DedupCountStrategy : public TraversalStrategy {
  public:
    static DedupCountStrategyPtr instance();

    void apply(const TraversalPtr& traversal) const override;

    [[nodiscard]] std::string getName() const override;

    [[nodiscard]] StrategyCategory getCategory() const override;

    /**
     * @brief Runs after the identity removal, so dedup().identity().count() is fused as well.
     */
    [[nodiscard]] std::set<std::string> applyPrior() const override;

  private:
    DedupCountStrategy() = default;
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_DEDUPCOUNTSTRATEGY_HPP_
