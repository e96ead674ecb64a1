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
#include <Traversal/Steps/Step.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>
#include <sstream>

namespace GTC {

Step::Step() : id(Util::getNextStepId()) {}

Step::Step(const Step& other) : std::enable_shared_from_this<Step>(), id(other.id), labels(other.labels) {}

StepId Step::getId() const { return id; }

const std::set<std::string>& Step::getLabels() const { return labels; }

bool Step::hasLabels() const { return !labels.empty(); }

void Step::addLabel(const std::string& label) {
    if (traversal != nullptr && traversal->isLocked()) {
        throw Exceptions::TraversalConstructionException("Cannot add label " + label + " to " + toString()
                                                         + ", the traversal is locked");
    }
    labels.insert(label);
    if (traversal != nullptr) {
        traversal->invalidateRequirements();
    }
}

void Step::removeLabel(const std::string& label) {
    if (traversal != nullptr && traversal->isLocked()) {
        throw Exceptions::TraversalConstructionException("Cannot remove label " + label + " from " + toString()
                                                         + ", the traversal is locked");
    }
    labels.erase(label);
    if (traversal != nullptr) {
        traversal->invalidateRequirements();
    }
}

void Step::clearLabels() {
    // copy, removeLabel modifies the set
    auto currentLabels = labels;
    for (const auto& label : currentLabels) {
        removeLabel(label);
    }
}

StepPtr Step::getNextStep() const { return nextStep.lock(); }

StepPtr Step::getPreviousStep() const { return previousStep.lock(); }

void Step::setNextStep(const StepPtr& step) { nextStep = step; }

void Step::setPreviousStep(const StepPtr& step) { previousStep = step; }

Traversal* Step::getTraversal() const { return traversal; }

void Step::setTraversal(Traversal* owner) { traversal = owner; }

TraverserRequirements Step::getRequirements() const { return {}; }

std::vector<TraverserPtr> Step::processTraversers(std::vector<TraverserPtr> traversers) {
    auto output = process(std::move(traversers));
    if (!labels.empty()) {
        for (const auto& traverser : output) {
            traverser->addLabels(labels);
        }
    }
    GTC_TRACE("Step: " << toString() << " emitted " << output.size() << " traversers");
    return output;
}

void Step::reset() {}

bool Step::equal(const StepPtr& other) const {
    if (!other) {
        return false;
    }
    const Step& otherStep = *other;
    return typeid(*this) == typeid(otherStep) && labels == other->labels && toString() == other->toString();
}

TraverserPtr Step::generateTraverser(Value value, uint64_t bulk) const {
    if (traversal == nullptr) {
        GTC_THROW_RUNTIME_ERROR("Step: cannot generate a traverser for " << toString() << " as it is not part of a traversal");
    }
    auto* root = traversal->getRootTraversal();
    auto traverser = Traverser::create(std::move(value), root->getTraverserRequirements(), root->getSideEffects(), bulk);
    return traverser;
}

std::string Step::stepString(const std::string& name, const std::vector<std::string>& arguments) const {
    std::stringstream ss;
    ss << name;
    if (!arguments.empty()) {
        ss << "(";
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i > 0) {
                ss << ",";
            }
            ss << arguments[i];
        }
        ss << ")";
    }
    if (!labels.empty()) {
        ss << "@[";
        bool first = true;
        for (const auto& label : labels) {
            if (!first) {
                ss << ", ";
            }
            ss << label;
            first = false;
        }
        ss << "]";
    }
    return ss.str();
}

}// namespace GTC
