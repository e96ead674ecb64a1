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

#include <Exceptions/TraversalConstructionException.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Steps/TraversalParent.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>
#include <Util/Logger/Logger.hpp>
#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace GTC {

Traversal::Traversal() : sideEffects(SideEffects::create()) {}

TraversalPtr Traversal::create() { return std::make_shared<Traversal>(); }

TraversalPtr Traversal::create(GraphPtr graph) {
    auto traversal = std::make_shared<Traversal>();
    traversal->graph = std::move(graph);
    return traversal;
}

void Traversal::checkUnlocked(const std::string& operation) const {
    if (locked) {
        throw Exceptions::TraversalConstructionException("Cannot " + operation + " as the traversal " + toString()
                                                         + " is locked");
    }
}

void Traversal::relinkSteps() {
    for (size_t i = 0; i < steps.size(); ++i) {
        steps[i]->setPreviousStep(i > 0 ? steps[i - 1] : nullptr);
        steps[i]->setNextStep(i + 1 < steps.size() ? steps[i + 1] : nullptr);
    }
}

void Traversal::addStep(const StepPtr& step) { addStep(steps.size(), step); }

void Traversal::addStep(size_t index, const StepPtr& step) {
    checkUnlocked("add a step");
    if (!step) {
        throw Exceptions::TraversalConstructionException("Cannot add an empty step");
    }
    if (step->getTraversal() != nullptr) {
        throw Exceptions::TraversalConstructionException("The step " + step->toString()
                                                         + " is already part of a traversal");
    }
    if (index > steps.size()) {
        throw Exceptions::TraversalConstructionException("Cannot add " + step->toString() + " at position "
                                                         + std::to_string(index) + " of a traversal with "
                                                         + std::to_string(steps.size()) + " steps");
    }
    steps.insert(steps.begin() + static_cast<std::ptrdiff_t>(index), step);
    step->setTraversal(this);
    relinkSteps();
    invalidateRequirements();
    GTC_TRACE("Traversal: added " << step->toString() << " at position " << index);
}

void Traversal::removeStep(size_t index) {
    checkUnlocked("remove a step");
    if (index >= steps.size()) {
        throw Exceptions::TraversalConstructionException("Cannot remove position " + std::to_string(index)
                                                         + " of a traversal with " + std::to_string(steps.size())
                                                         + " steps");
    }
    auto step = steps[index];
    if (step->hasLabels()) {
        StepPtr receiver = index + 1 < steps.size() ? steps[index + 1] : (index > 0 ? steps[index - 1] : nullptr);
        if (receiver && !receiver->hasLabels()) {
            for (const auto& label : step->getLabels()) {
                receiver->addLabel(label);
            }
            GTC_TRACE("Traversal: moved labels of " << step->toString() << " to " << receiver->toString());
        }
    }
    steps.erase(steps.begin() + static_cast<std::ptrdiff_t>(index));
    step->setTraversal(nullptr);
    step->setPreviousStep(nullptr);
    step->setNextStep(nullptr);
    relinkSteps();
    invalidateRequirements();
    GTC_TRACE("Traversal: removed " << step->toString() << " from position " << index);
}

void Traversal::removeStep(const StepPtr& step) {
    auto index = indexOf(step);
    if (!index.has_value()) {
        throw Exceptions::TraversalConstructionException("The step " + (step ? step->toString() : std::string("null"))
                                                         + " is not part of the traversal " + toString());
    }
    removeStep(index.value());
}

const std::vector<StepPtr>& Traversal::getSteps() const { return steps; }

std::vector<StepPtr> Traversal::getSteps(StepCapability capability, const StepPredicate& predicate) const {
    return getSteps([&capability, &predicate](const StepPtr& step) {
        return step->getCapability() == capability && (!predicate || predicate(step));
    });
}

std::vector<StepPtr> Traversal::getSteps(const StepPredicate& predicate) const {
    std::vector<StepPtr> result;
    std::copy_if(steps.begin(), steps.end(), std::back_inserter(result), predicate);
    return result;
}

std::optional<size_t> Traversal::indexOf(const StepPtr& step) const {
    auto found = std::find(steps.begin(), steps.end(), step);
    if (found == steps.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(steps.begin(), found));
}

StepPtr Traversal::getStartStep() const { return steps.empty() ? nullptr : steps.front(); }

StepPtr Traversal::getEndStep() const { return steps.empty() ? nullptr : steps.back(); }

bool Traversal::isEmpty() const { return steps.empty(); }

size_t Traversal::size() const { return steps.size(); }

TraversalParent* Traversal::getParent() const { return parent; }

void Traversal::setParent(TraversalParent* newParent) { parent = newParent; }

bool Traversal::isRoot() const { return parent == nullptr; }

Traversal* Traversal::getRootTraversal() {
    Traversal* current = this;
    while (current->parent != nullptr) {
        auto* parentStep = current->parent->asStep();
        if (parentStep == nullptr || parentStep->getTraversal() == nullptr) {
            break;
        }
        current = parentStep->getTraversal();
    }
    return current;
}

const Traversal* Traversal::getRootTraversal() const { return const_cast<Traversal*>(this)->getRootTraversal(); }

SideEffectsPtr Traversal::getSideEffects() const {
    const auto* root = getRootTraversal();
    return root->sideEffects;
}

void Traversal::setSideEffects(SideEffectsPtr newSideEffects) {
    sideEffects = std::move(newSideEffects);
    invalidateRequirements();
}

GraphPtr Traversal::getGraph() const { return getRootTraversal()->graph; }

void Traversal::setGraph(GraphPtr newGraph) { graph = std::move(newGraph); }

TraversalStrategiesPtr Traversal::getStrategies() const { return getRootTraversal()->strategies; }

void Traversal::setStrategies(TraversalStrategiesPtr newStrategies) { strategies = std::move(newStrategies); }

bool Traversal::isOnGraphComputer() const { return getRootTraversal()->onGraphComputer; }

void Traversal::setOnGraphComputer(bool graphComputer) {
    checkUnlocked("change the execution mode");
    onGraphComputer = graphComputer;
}

void Traversal::applyStrategies() {
    if (locked) {
        return;
    }
    auto strategiesToApply = getStrategies();
    if (!strategiesToApply) {
        strategiesToApply = Optimizer::TraversalStrategies::getDefaultStrategies();
    }
    strategiesToApply->applyStrategies(shared_from_this());
}

void Traversal::lock() {
    locked = true;
    for (const auto& step : steps) {
        if (auto* stepParent = dynamic_cast<TraversalParent*>(step.get())) {
            for (const auto& child : stepParent->getChildren()) {
                child->lock();
            }
        }
    }
}

bool Traversal::isLocked() const { return locked; }

TraverserRequirements Traversal::getTraverserRequirements() const {
    if (!requirements.has_value()) {
        requirements = computeTraverserRequirements();
    }
    return requirements.value();
}

TraverserRequirements Traversal::computeTraverserRequirements() const {
    TraverserRequirements result{TraverserRequirement::OBJECT};
    for (const auto& step : steps) {
        auto stepRequirements = step->getRequirements();
        result.insert(stepRequirements.begin(), stepRequirements.end());
        if (step->hasLabels()) {
            result.insert(TraverserRequirement::LABELED_PATH);
        }
        if (auto* stepParent = dynamic_cast<TraversalParent*>(step.get())) {
            for (const auto& child : stepParent->getChildren()) {
                auto childRequirements = child->getTraverserRequirements();
                result.insert(childRequirements.begin(), childRequirements.end());
            }
        }
    }
    // children share the bag of the root, it is accounted for there
    if (isRoot() && sideEffects != nullptr && !sideEffects->isEmpty()) {
        result.insert(TraverserRequirement::SIDE_EFFECTS);
    }
    return result;
}

bool Traversal::hasStaleRequirements() const {
    return requirements.has_value() && requirements.value() != computeTraverserRequirements();
}

void Traversal::invalidateRequirements() {
    requirements.reset();
    if (parent != nullptr) {
        auto* parentStep = parent->asStep();
        if (parentStep != nullptr && parentStep->getTraversal() != nullptr) {
            parentStep->getTraversal()->invalidateRequirements();
        }
    }
}

std::vector<TraverserPtr> Traversal::processTraversers(std::vector<TraverserPtr> traversers) {
    for (const auto& step : steps) {
        traversers = step->processTraversers(std::move(traversers));
    }
    return traversers;
}

std::vector<Value> Traversal::toList() {
    if (!locked) {
        applyStrategies();
    }
    reset();
    std::vector<Value> result;
    for (const auto& traverser : processTraversers({})) {
        for (uint64_t i = 0; i < traverser->getBulk(); ++i) {
            result.push_back(traverser->get());
        }
    }
    GTC_DEBUG("Traversal: " << toString() << " produced " << result.size() << " values");
    return result;
}

void Traversal::reset() {
    for (const auto& step : steps) {
        step->reset();
    }
}

TraversalPtr Traversal::clone() const {
    auto copy = std::make_shared<Traversal>();
    copy->graph = graph;
    copy->strategies = strategies;
    copy->onGraphComputer = onGraphComputer;
    copy->sideEffects = sideEffects ? sideEffects->copy() : SideEffects::create();
    for (const auto& step : steps) {
        copy->addStep(step->clone());
    }
    copy->locked = locked;
    return copy;
}

std::string Traversal::toString() const {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < steps.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << steps[i]->toString();
    }
    ss << "]";
    return ss.str();
}

bool Traversal::equal(const TraversalPtr& other) const {
    if (!other || other->steps.size() != steps.size()) {
        return false;
    }
    for (size_t i = 0; i < steps.size(); ++i) {
        if (!steps[i]->equal(other->steps[i])) {
            return false;
        }
    }
    return true;
}

}// namespace GTC
