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

#include <Traversal/Steps/Branch/UnionStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

UnionStep::UnionStep(const std::vector<TraversalPtr>& unionTraversals) : unionTraversals(unionTraversals) {
    integrateChildren(this->unionTraversals);
}

UnionStep::UnionStep(const UnionStep& other) : Step(other), TraversalParent(other) {
    for (const auto& child : other.unionTraversals) {
        auto childCopy = child->clone();
        integrateChild(childCopy);
        unionTraversals.push_back(childCopy);
    }
}

UnionStepPtr UnionStep::create(const std::vector<TraversalPtr>& unionTraversals) {
    return std::make_shared<UnionStep>(unionTraversals);
}

std::vector<TraversalPtr> UnionStep::getGlobalChildren() const { return unionTraversals; }

StepCapability UnionStep::getCapability() const { return StepCapability::MAP; }

std::vector<TraverserPtr> UnionStep::process(std::vector<TraverserPtr> traversers) {
    std::vector<TraverserPtr> output;
    for (const auto& child : unionTraversals) {
        std::vector<TraverserPtr> branchInput;
        branchInput.reserve(traversers.size());
        for (const auto& traverser : traversers) {
            branchInput.push_back(traverser->split());
        }
        child->reset();
        auto branchOutput = child->processTraversers(std::move(branchInput));
        output.insert(output.end(), branchOutput.begin(), branchOutput.end());
    }
    return output;
}

void UnionStep::reset() {
    for (const auto& child : unionTraversals) {
        child->reset();
    }
}

StepPtr UnionStep::clone() const { return std::shared_ptr<UnionStep>(new UnionStep(*this)); }

std::string UnionStep::toString() const {
    std::vector<std::string> arguments;
    for (const auto& child : unionTraversals) {
        arguments.push_back(child->toString());
    }
    return stepString("UnionStep", arguments);
}

}// namespace GTC
