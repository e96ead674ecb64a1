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

#include <Traversal/Steps/Map/LocalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalUtil.hpp>

namespace GTC {

LocalStep::LocalStep(const TraversalPtr& localTraversal) : localTraversal(localTraversal) { integrateChild(this->localTraversal); }

LocalStep::LocalStep(const LocalStep& other) : Step(other), TraversalParent(other), localTraversal(other.localTraversal->clone()) {
    integrateChild(localTraversal);
}

LocalStepPtr LocalStep::create(const TraversalPtr& localTraversal) { return std::make_shared<LocalStep>(localTraversal); }

std::vector<TraversalPtr> LocalStep::getLocalChildren() const { return {localTraversal}; }

StepCapability LocalStep::getCapability() const { return StepCapability::MAP; }

std::vector<TraverserPtr> LocalStep::process(std::vector<TraverserPtr> traversers) {
    std::vector<TraverserPtr> output;
    for (const auto& traverser : traversers) {
        auto results = TraversalUtil::apply(traverser, localTraversal);
        output.insert(output.end(), results.begin(), results.end());
    }
    return output;
}

void LocalStep::reset() { localTraversal->reset(); }

StepPtr LocalStep::clone() const { return std::shared_ptr<LocalStep>(new LocalStep(*this)); }

std::string LocalStep::toString() const { return stepString("LocalStep", {localTraversal->toString()}); }

}// namespace GTC
