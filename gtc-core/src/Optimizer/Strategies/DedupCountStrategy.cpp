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

#include <Optimizer/Strategies/DedupCountStrategy.hpp>
#include <Traversal/Steps/Filter/DedupGlobalStep.hpp>
#include <Traversal/Steps/Map/CountGlobalStep.hpp>
#include <Traversal/Steps/Map/DedupCountGlobalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalHelper.hpp>
#include <Util/Logger/Logger.hpp>

namespace GTC::Optimizer {

DedupCountStrategyPtr DedupCountStrategy::instance() {
    static const DedupCountStrategyPtr strategy(new DedupCountStrategy());
    return strategy;
}

void DedupCountStrategy::apply(const TraversalPtr& traversal) const {
    if (!TraversalHelper::onGraphComputer(*traversal) || !TraversalHelper::isGlobalChild(*traversal)) {
        return;
    }
    for (const auto& dedupStep : traversal->getStepsOfClass<DedupGlobalStep>()) {
        auto countStep = dedupStep->getNextStep();
        if (dedupStep->hasLabels() || !countStep || !countStep->instanceOf<CountGlobalStep>()) {
            continue;
        }
        auto dedupCountStep = DedupCountGlobalStep::create();
        for (const auto& label : countStep->getLabels()) {
            dedupCountStep->addLabel(label);
        }
        countStep->clearLabels();
        TraversalHelper::replaceStep(dedupStep, dedupCountStep, *traversal);
        traversal->removeStep(countStep);
        GTC_DEBUG("DedupCountStrategy: fused " << dedupStep->toString() << " and " << countStep->toString() << " into "
                                               << dedupCountStep->toString());
    }
}

std::string DedupCountStrategy::getName() const { return "DedupCountStrategy"; }

StrategyCategory DedupCountStrategy::getCategory() const { return StrategyCategory::OPTIMIZATION; }

std::set<std::string> DedupCountStrategy::applyPrior() const { return {"IdentityRemovalStrategy"}; }

}// namespace GTC::Optimizer
