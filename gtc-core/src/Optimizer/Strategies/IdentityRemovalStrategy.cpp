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

#include <Optimizer/Strategies/IdentityRemovalStrategy.hpp>
#include <Traversal/Steps/Filter/IdentityStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Util/Logger/Logger.hpp>

namespace GTC::Optimizer {

IdentityRemovalStrategyPtr IdentityRemovalStrategy::instance() {
    static const IdentityRemovalStrategyPtr strategy(new IdentityRemovalStrategy());
    return strategy;
}

void IdentityRemovalStrategy::apply(const TraversalPtr& traversal) const {
    if (traversal->size() <= 1) {
        return;
    }
    for (const auto& identityStep : traversal->getStepsOfClass<IdentityStep>()) {
        if (identityStep->hasLabels()) {
            auto previousStep = identityStep->getPreviousStep();
            if (!previousStep) {
                continue;
            }
            for (const auto& label : identityStep->getLabels()) {
                previousStep->addLabel(label);
            }
            identityStep->clearLabels();
        }
        GTC_TRACE("IdentityRemovalStrategy: removing " << identityStep->toString());
        traversal->removeStep(identityStep);
    }
}

std::string IdentityRemovalStrategy::getName() const { return "IdentityRemovalStrategy"; }

StrategyCategory IdentityRemovalStrategy::getCategory() const { return StrategyCategory::OPTIMIZATION; }

}// namespace GTC::Optimizer
