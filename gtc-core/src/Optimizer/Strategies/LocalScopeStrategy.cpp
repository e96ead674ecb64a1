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

#include <Optimizer/Strategies/LocalScopeStrategy.hpp>
#include <Traversal/Steps/Filter/WhereTraversalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalHelper.hpp>
#include <Util/Logger/Logger.hpp>
#include <algorithm>

namespace GTC::Optimizer {

LocalScopeStrategyPtr LocalScopeStrategy::instance() {
    static const LocalScopeStrategyPtr strategy(new LocalScopeStrategy());
    return strategy;
}

void LocalScopeStrategy::apply(const TraversalPtr& traversal) const {
    auto whereSteps = traversal->getStepsOfClass<WhereTraversalStep>();
    if (whereSteps.empty()) {
        return;
    }
    auto labels = TraversalHelper::getLabels(traversal->getRootTraversal()->shared_from_this());
    for (const auto& whereStep : whereSteps) {
        if (whereStep->getScope() == Scope::LOCAL) {
            continue;
        }
        auto scopeKeys = whereStep->getScopeKeys();
        if (std::none_of(scopeKeys.begin(), scopeKeys.end(), [&labels](const std::string& key) {
                return labels.contains(key);
            })) {
            GTC_DEBUG("LocalScopeStrategy: " << whereStep->toString() << " has no labelled binding, switching to LOCAL");
            whereStep->setScope(Scope::LOCAL);
        }
    }
}

std::string LocalScopeStrategy::getName() const { return "LocalScopeStrategy"; }

StrategyCategory LocalScopeStrategy::getCategory() const { return StrategyCategory::OPTIMIZATION; }

std::set<std::string> LocalScopeStrategy::applyPrior() const { return {"IdentityRemovalStrategy"}; }

}// namespace GTC::Optimizer
