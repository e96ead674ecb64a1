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

#include <Traversal/Steps/Filter/NotStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalUtil.hpp>

namespace GTC {

NotStep::NotStep(const TraversalPtr& notTraversal) : notTraversal(notTraversal) { integrateChild(this->notTraversal); }

NotStep::NotStep(const NotStep& other) : FilterStep(other), TraversalParent(other), notTraversal(other.notTraversal->clone()) {
    integrateChild(notTraversal);
}

NotStepPtr NotStep::create(const TraversalPtr& notTraversal) { return std::make_shared<NotStep>(notTraversal); }

std::vector<TraversalPtr> NotStep::getLocalChildren() const { return {notTraversal}; }

bool NotStep::filter(const TraverserPtr& traverser) { return !TraversalUtil::test(traverser, notTraversal); }

void NotStep::reset() { notTraversal->reset(); }

StepPtr NotStep::clone() const { return std::shared_ptr<NotStep>(new NotStep(*this)); }

std::string NotStep::toString() const { return stepString("NotStep", {notTraversal->toString()}); }

}// namespace GTC
