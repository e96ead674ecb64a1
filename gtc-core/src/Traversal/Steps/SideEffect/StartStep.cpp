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

#include <Traversal/Steps/SideEffect/StartStep.hpp>
#include <typeinfo>

namespace GTC {

StartStep::StartStep(std::vector<Value> startValues) : startValues(std::move(startValues)) {}

StartStepPtr StartStep::create(std::vector<Value> startValues) { return std::make_shared<StartStep>(std::move(startValues)); }

bool StartStep::isVariableStartStep(const StepPtr& step) {
    if (!step) {
        return false;
    }
    // subclasses such as the graph step are never variables
    const Step& stepRef = *step;
    if (typeid(stepRef) != typeid(StartStep)) {
        return false;
    }
    return step->as<StartStep>()->getStartValues().empty() && step->getLabels().size() == 1;
}

const std::vector<Value>& StartStep::getStartValues() const { return startValues; }

StepCapability StartStep::getCapability() const { return StepCapability::SIDE_EFFECT; }

std::vector<TraverserPtr> StartStep::process(std::vector<TraverserPtr> traversers) {
    for (const auto& value : startValues) {
        traversers.push_back(generateTraverser(value));
    }
    return traversers;
}

StepPtr StartStep::clone() const { return std::shared_ptr<StartStep>(new StartStep(*this)); }

std::string StartStep::toString() const {
    std::vector<std::string> arguments;
    for (const auto& value : startValues) {
        arguments.push_back(GTC::toString(value));
    }
    return stepString("StartStep", arguments);
}

}// namespace GTC
