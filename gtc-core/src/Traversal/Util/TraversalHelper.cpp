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

#include <Exceptions/InvariantViolationException.hpp>
#include <Exceptions/TraversalConstructionException.hpp>
#include <Traversal/Util/TraversalHelper.hpp>
#include <Util/Logger/Logger.hpp>
#include <algorithm>
#include <unordered_set>

namespace GTC {

void TraversalHelper::replaceStep(const StepPtr& removeStep, const StepPtr& insertStep, Traversal& traversal) {
    auto index = traversal.indexOf(removeStep);
    if (!index.has_value()) {
        throw Exceptions::TraversalConstructionException("Cannot replace " + removeStep->toString()
                                                         + " as it is not part of " + traversal.toString());
    }
    for (const auto& label : removeStep->getLabels()) {
        insertStep->addLabel(label);
    }
    removeStep->clearLabels();
    traversal.removeStep(index.value());
    traversal.addStep(index.value(), insertStep);
}

void TraversalHelper::insertBeforeStep(const StepPtr& insertStep, const StepPtr& afterStep, Traversal& traversal) {
    auto index = traversal.indexOf(afterStep);
    if (!index.has_value()) {
        throw Exceptions::TraversalConstructionException("Cannot insert before " + afterStep->toString()
                                                         + " as it is not part of " + traversal.toString());
    }
    traversal.addStep(index.value(), insertStep);
}

void TraversalHelper::insertAfterStep(const StepPtr& insertStep, const StepPtr& beforeStep, Traversal& traversal) {
    auto index = traversal.indexOf(beforeStep);
    if (!index.has_value()) {
        throw Exceptions::TraversalConstructionException("Cannot insert after " + beforeStep->toString()
                                                         + " as it is not part of " + traversal.toString());
    }
    traversal.addStep(index.value() + 1, insertStep);
}

bool TraversalHelper::onGraphComputer(const Traversal& traversal) { return traversal.isOnGraphComputer(); }

bool TraversalHelper::isGlobalChild(const Traversal& traversal) {
    const Traversal* current = &traversal;
    while (current->getParent() != nullptr) {
        auto* parent = current->getParent();
        auto localChildren = parent->getLocalChildren();
        if (std::any_of(localChildren.begin(), localChildren.end(), [current](const TraversalPtr& child) {
                return child.get() == current;
            })) {
            return false;
        }
        auto* parentStep = parent->asStep();
        if (parentStep == nullptr || parentStep->getTraversal() == nullptr) {
            break;
        }
        current = parentStep->getTraversal();
    }
    return true;
}

bool TraversalHelper::isLocalChild(const Traversal& traversal) { return !isGlobalChild(traversal); }

std::set<std::string> TraversalHelper::getLabels(const TraversalPtr& traversal) {
    std::set<std::string> labels;
    for (const auto& current : getTraversalsBreadthFirst(traversal)) {
        for (const auto& step : current->getSteps()) {
            labels.insert(step->getLabels().begin(), step->getLabels().end());
        }
    }
    return labels;
}

std::vector<TraversalPtr> TraversalHelper::getTraversalsBreadthFirst(const TraversalPtr& traversal) {
    std::vector<TraversalPtr> result;
    std::deque<TraversalPtr> worklist{traversal};
    while (!worklist.empty()) {
        auto current = worklist.front();
        worklist.pop_front();
        result.push_back(current);
        for (const auto& step : current->getSteps()) {
            if (auto* parent = dynamic_cast<TraversalParent*>(step.get())) {
                auto children = parent->getChildren();
                worklist.insert(worklist.end(), children.begin(), children.end());
            }
        }
    }
    return result;
}

void TraversalHelper::verifyInvariants(const TraversalPtr& traversal) {
    for (const auto& current : getTraversalsBreadthFirst(traversal)) {
        const auto& steps = current->getSteps();
        std::unordered_set<const Step*> seen;
        for (size_t i = 0; i < steps.size(); ++i) {
            const auto& step = steps[i];
            if (!step) {
                throw Exceptions::InvariantViolationException("Empty step at position " + std::to_string(i) + " of "
                                                              + current->toString());
            }
            if (!seen.insert(step.get()).second) {
                throw Exceptions::InvariantViolationException("The step " + step->toString() + " occurs twice in "
                                                              + current->toString());
            }
            if (step->getTraversal() != current.get()) {
                throw Exceptions::InvariantViolationException("The step " + step->toString()
                                                              + " is not owned by the traversal " + current->toString());
            }
            auto expectedPrevious = i > 0 ? steps[i - 1] : nullptr;
            auto expectedNext = i + 1 < steps.size() ? steps[i + 1] : nullptr;
            if (step->getPreviousStep() != expectedPrevious || step->getNextStep() != expectedNext) {
                throw Exceptions::InvariantViolationException("The step " + step->toString() + " is mislinked in "
                                                              + current->toString());
            }
            if (auto* parent = dynamic_cast<TraversalParent*>(step.get())) {
                for (const auto& child : parent->getChildren()) {
                    if (child->getParent() != parent) {
                        throw Exceptions::InvariantViolationException("The child " + child->toString()
                                                                      + " is not owned by " + step->toString());
                    }
                }
            }
        }
        if (current->hasStaleRequirements()) {
            throw Exceptions::InvariantViolationException("The requirements of " + current->toString() + " are stale");
        }
    }
    GTC_TRACE("TraversalHelper: verified the invariants of " << traversal->toString());
}

}// namespace GTC
