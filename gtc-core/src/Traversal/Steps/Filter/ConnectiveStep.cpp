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

#include <Traversal/Steps/Filter/ConnectiveStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalUtil.hpp>
#include <algorithm>

namespace GTC {

ConnectiveStep::ConnectiveStep(const std::vector<TraversalPtr>& traversals) : traversals(traversals) {
    integrateChildren(this->traversals);
}

ConnectiveStep::ConnectiveStep(const ConnectiveStep& other) : FilterStep(other), TraversalParent(other) {
    for (const auto& child : other.traversals) {
        auto childCopy = child->clone();
        integrateChild(childCopy);
        traversals.push_back(childCopy);
    }
}

std::vector<TraversalPtr> ConnectiveStep::getLocalChildren() const { return traversals; }

void ConnectiveStep::reset() {
    for (const auto& child : traversals) {
        child->reset();
    }
}

std::vector<std::string> ConnectiveStep::childStrings() const {
    std::vector<std::string> result;
    for (const auto& child : traversals) {
        result.push_back(child->toString());
    }
    return result;
}

AndStep::AndStep(const std::vector<TraversalPtr>& traversals) : ConnectiveStep(traversals) {}

AndStepPtr AndStep::create(const std::vector<TraversalPtr>& traversals) { return std::make_shared<AndStep>(traversals); }

bool AndStep::filter(const TraverserPtr& traverser) {
    return std::all_of(traversals.begin(), traversals.end(), [&traverser](const TraversalPtr& child) {
        return TraversalUtil::test(traverser, child);
    });
}

StepPtr AndStep::clone() const { return std::shared_ptr<AndStep>(new AndStep(*this)); }

std::string AndStep::toString() const { return stepString("AndStep", childStrings()); }

OrStep::OrStep(const std::vector<TraversalPtr>& traversals) : ConnectiveStep(traversals) {}

OrStepPtr OrStep::create(const std::vector<TraversalPtr>& traversals) { return std::make_shared<OrStep>(traversals); }

bool OrStep::filter(const TraverserPtr& traverser) {
    return std::any_of(traversals.begin(), traversals.end(), [&traverser](const TraversalPtr& child) {
        return TraversalUtil::test(traverser, child);
    });
}

StepPtr OrStep::clone() const { return std::shared_ptr<OrStep>(new OrStep(*this)); }

std::string OrStep::toString() const { return stepString("OrStep", childStrings()); }

}// namespace GTC
