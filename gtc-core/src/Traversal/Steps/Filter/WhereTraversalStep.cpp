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
#include <Traversal/Steps/Filter/ConnectiveStep.hpp>
#include <Traversal/Steps/Filter/NotStep.hpp>
#include <Traversal/Steps/Filter/WhereTraversalStep.hpp>
#include <Traversal/Steps/SideEffect/StartStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>
#include <Traversal/Util/TraversalHelper.hpp>
#include <Traversal/Util/TraversalUtil.hpp>
#include <deque>
#include <magic_enum.hpp>

namespace GTC {

WhereTraversalStep::WhereTraversalStep(Scope scope, const TraversalPtr& whereTraversal)
    : scope(scope), whereTraversal(whereTraversal->clone()) {
    configureStartAndEndSteps();
    integrateChild(this->whereTraversal);
}

WhereTraversalStep::WhereTraversalStep(const WhereTraversalStep& other)
    : FilterStep(other), TraversalParent(other), Scoping(other), scope(other.scope), scopeKeys(other.scopeKeys),
      whereTraversal(other.whereTraversal->clone()) {
    integrateChild(whereTraversal);
}

WhereTraversalStepPtr WhereTraversalStep::create(Scope scope, const TraversalPtr& whereTraversal) {
    return std::make_shared<WhereTraversalStep>(scope, whereTraversal);
}

void WhereTraversalStep::configureStartAndEndSteps() {
    std::deque<TraversalPtr> worklist{whereTraversal};
    while (!worklist.empty()) {
        auto current = worklist.front();
        worklist.pop_front();
        if (current->isEmpty()) {
            continue;
        }

        auto startStep = current->getStartStep();
        if (startStep->instanceOf<ConnectiveStep>() || startStep->instanceOf<NotStep>()) {
            // labels may hide in the children of and(), or() and not()
            for (const auto& child : dynamic_cast<TraversalParent*>(startStep.get())->getLocalChildren()) {
                worklist.push_back(child);
            }
        } else if (StartStep::isVariableStartStep(startStep)) {
            auto label = *startStep->getLabels().begin();
            scopeKeys.insert(label);
            startStep->removeLabel(label);
            TraversalHelper::insertBeforeStep(WhereStartStep::create(label, scope), startStep, *current);
            current->removeStep(startStep);
        } else if (current->getEndStep()->hasLabels()) {
            TraversalHelper::insertBeforeStep(WhereStartStep::create(std::nullopt, scope), startStep, *current);
        }

        auto endStep = current->getEndStep();
        if (endStep->hasLabels()) {
            if (endStep->getLabels().size() > 1) {
                throw Exceptions::TraversalConstructionException("The end step of a where()-traversal can only have one label: "
                                                                 + endStep->toString());
            }
            auto label = *endStep->getLabels().begin();
            scopeKeys.insert(label);
            endStep->removeLabel(label);
            current->addStep(WhereEndStep::create(label, scope));
        }
    }
    if (scopeKeys.empty()) {
        throw Exceptions::TraversalConstructionException(
            "A where()-traversal must have at least a start or end label (i.e. variable): " + whereTraversal->toString());
    }
    GTC_DEBUG("WhereTraversalStep: configured " << whereTraversal->toString() << " with " << scopeKeys.size() << " scope keys");
}

const TraversalPtr& WhereTraversalStep::getWhereTraversal() const { return whereTraversal; }

std::vector<TraversalPtr> WhereTraversalStep::getLocalChildren() const { return {whereTraversal}; }

std::set<std::string> WhereTraversalStep::getScopeKeys() const { return scopeKeys; }

Scope WhereTraversalStep::getScope() const { return scope; }

void WhereTraversalStep::setScope(Scope newScope) {
    if (traversal != nullptr && traversal->isLocked()) {
        throw Exceptions::TraversalConstructionException("Cannot change the scope of " + toString()
                                                         + ", the traversal is locked");
    }
    scope = newScope;
    for (const auto& startStep : TraversalHelper::getStepsOfClassRecursively<WhereStartStep>(whereTraversal)) {
        startStep->setScope(newScope);
    }
    for (const auto& endStep : TraversalHelper::getStepsOfClassRecursively<WhereEndStep>(whereTraversal)) {
        endStep->setScope(newScope);
    }
    if (traversal != nullptr) {
        traversal->invalidateRequirements();
    }
}

TraverserRequirements WhereTraversalStep::getRequirements() const {
    if (scope == Scope::LOCAL) {
        return {TraverserRequirement::OBJECT, TraverserRequirement::SIDE_EFFECTS};
    }
    return {TraverserRequirement::PATH, TraverserRequirement::SIDE_EFFECTS};
}

bool WhereTraversalStep::filter(const TraverserPtr& traverser) { return TraversalUtil::test(traverser, whereTraversal); }

void WhereTraversalStep::reset() { whereTraversal->reset(); }

StepPtr WhereTraversalStep::clone() const { return std::shared_ptr<WhereTraversalStep>(new WhereTraversalStep(*this)); }

std::string WhereTraversalStep::toString() const {
    return stepString("WhereTraversalStep", {std::string(magic_enum::enum_name(scope)), whereTraversal->toString()});
}

WhereStartStep::WhereStartStep(std::optional<std::string> selectKey, Scope scope)
    : selectKey(std::move(selectKey)), scope(scope) {}

WhereStartStepPtr WhereStartStep::create(std::optional<std::string> selectKey, Scope scope) {
    return std::make_shared<WhereStartStep>(std::move(selectKey), scope);
}

const std::optional<std::string>& WhereStartStep::getSelectKey() const { return selectKey; }

std::set<std::string> WhereStartStep::getScopeKeys() const {
    if (selectKey.has_value()) {
        return {selectKey.value()};
    }
    return {};
}

Scope WhereStartStep::getScope() const { return scope; }

void WhereStartStep::setScope(Scope newScope) { scope = newScope; }

StepCapability WhereStartStep::getCapability() const { return StepCapability::MAP; }

std::vector<TraverserPtr> WhereStartStep::process(std::vector<TraverserPtr> traversers) {
    WhereEndStepPtr whereEndStep;
    if (traversal != nullptr && traversal->getEndStep()->instanceOf<WhereEndStep>()) {
        whereEndStep = traversal->getEndStep()->as<WhereEndStep>();
    }
    std::vector<TraverserPtr> output;
    for (const auto& traverser : traversers) {
        if (whereEndStep) {
            whereEndStep->processStartTraverser(traverser);
        }
        if (!selectKey.has_value()) {
            output.push_back(traverser);
            continue;
        }
        auto boundValue = getScopeValue(Pop::LAST, selectKey.value(), traverser);
        if (!boundValue.has_value()) {
            GTC_TRACE("WhereStartStep: " << selectKey.value() << " is not bound for " << traverser->toString());
            continue;
        }
        output.push_back(traverser->split(boundValue.value()));
    }
    return output;
}

StepPtr WhereStartStep::clone() const { return std::shared_ptr<WhereStartStep>(new WhereStartStep(*this)); }

std::string WhereStartStep::toString() const {
    std::vector<std::string> arguments{std::string(magic_enum::enum_name(scope))};
    if (selectKey.has_value()) {
        arguments.push_back(selectKey.value());
    }
    return stepString("WhereStartStep", arguments);
}

WhereEndStep::WhereEndStep(std::optional<std::string> matchKey, Scope scope) : matchKey(std::move(matchKey)), scope(scope) {}

WhereEndStep::WhereEndStep(const WhereEndStep& other)
    : FilterStep(other), Scoping(other), matchKey(other.matchKey), scope(other.scope) {}

WhereEndStepPtr WhereEndStep::create(std::optional<std::string> matchKey, Scope scope) {
    return std::make_shared<WhereEndStep>(std::move(matchKey), scope);
}

void WhereEndStep::processStartTraverser(const TraverserPtr& traverser) {
    if (matchKey.has_value()) {
        matchValue = getScopeValue(Pop::LAST, matchKey.value(), traverser);
    }
}

const std::optional<std::string>& WhereEndStep::getMatchKey() const { return matchKey; }

std::set<std::string> WhereEndStep::getScopeKeys() const {
    if (matchKey.has_value()) {
        return {matchKey.value()};
    }
    return {};
}

Scope WhereEndStep::getScope() const { return scope; }

void WhereEndStep::setScope(Scope) {}

bool WhereEndStep::filter(const TraverserPtr& traverser) {
    if (!matchKey.has_value()) {
        return true;
    }
    return matchValue.has_value() && traverser->get() == matchValue.value();
}

void WhereEndStep::reset() { matchValue.reset(); }

StepPtr WhereEndStep::clone() const { return std::shared_ptr<WhereEndStep>(new WhereEndStep(*this)); }

std::string WhereEndStep::toString() const {
    std::vector<std::string> arguments{std::string(magic_enum::enum_name(scope))};
    if (matchKey.has_value()) {
        arguments.push_back(matchKey.value());
    }
    return stepString("WhereEndStep", arguments);
}

}// namespace GTC
