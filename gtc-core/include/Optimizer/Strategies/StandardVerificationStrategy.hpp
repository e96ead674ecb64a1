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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_STANDARDVERIFICATIONSTRATEGY_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_STANDARDVERIFICATIONSTRATEGY_HPP_

#include <Optimizer/TraversalStrategy.hpp>

namespace GTC::Optimizer {

class StandardVerificationStrategy;
using StandardVerificationStrategyPtr = std::shared_ptr<const StandardVerificationStrategy>;

/**
 * @brief Checks the pipeline invariants of a traversal (see TraversalHelper::verifyInvariants).
 */
class StandardVerificationStrategy : public TraversalStrategy {
  public:
    static StandardVerificationStrategyPtr instance();

    void apply(const TraversalPtr& traversal) const override;

    [[nodiscard]] std::string getName() const override;

    [[nodiscard]] StrategyCategory getCategory() const override;

  private:
    StandardVerificationStrategy() = default;
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_STANDARDVERIFICATIONSTRATEGY_HPP_
