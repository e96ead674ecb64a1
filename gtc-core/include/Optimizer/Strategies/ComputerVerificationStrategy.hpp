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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_COMPUTERVERIFICATIONSTRATEGY_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_COMPUTERVERIFICATIONSTRATEGY_HPP_

#include <Optimizer/TraversalStrategy.hpp>

namespace GTC::Optimizer {

class ComputerVerificationStrategy;
using ComputerVerificationStrategyPtr = std::shared_ptr<const ComputerVerificationStrategy>;

/**
 * @brief Rejects traversals the graph computer cannot execute: a local child is evaluated on the worker holding the
 * current vertex and can therefore not move further than the adjacent vertices, i.e., it may hold at most one
 * VertexStep.
 * @throws VerificationException
 */
class ComputerVerificationStrategy : public TraversalStrategy {
  public:
    static ComputerVerificationStrategyPtr instance();

    void apply(const TraversalPtr& traversal) const override;

    [[nodiscard]] std::string getName() const override;

    [[nodiscard]] StrategyCategory getCategory() const override;

  private:
    ComputerVerificationStrategy() = default;
};

}// namespace GTC::Optimizer

#endif// GTC_CORE_INCLUDE_OPTIMIZER_STRATEGIES_COMPUTERVERIFICATIONSTRATEGY_HPP_
