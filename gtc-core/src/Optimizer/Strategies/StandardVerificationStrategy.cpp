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

#include <Optimizer/Strategies/StandardVerificationStrategy.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalHelper.hpp>

namespace GTC::Optimizer {

StandardVerificationStrategyPtr StandardVerificationStrategy::instance() {
    static const StandardVerificationStrategyPtr strategy(new StandardVerificationStrategy());
    return strategy;
}

void StandardVerificationStrategy::apply(const TraversalPtr& traversal) const { TraversalHelper::verifyInvariants(traversal); }

std::string StandardVerificationStrategy::getName() const { return "StandardVerificationStrategy"; }

StrategyCategory StandardVerificationStrategy::getCategory() const { return StrategyCategory::VERIFICATION; }

}// namespace GTC::Optimizer
