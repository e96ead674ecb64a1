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

#include <Traversal/Steps/Filter/IsStep.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

IsStep::IsStep(Value value) : value(std::move(value)) {}

IsStepPtr IsStep::create(Value value) { return std::make_shared<IsStep>(std::move(value)); }

const Value& IsStep::getValue() const { return value; }

bool IsStep::filter(const TraverserPtr& traverser) { return traverser->get() == value; }

StepPtr IsStep::clone() const { return std::shared_ptr<IsStep>(new IsStep(*this)); }

std::string IsStep::toString() const { return stepString("IsStep", {GTC::toString(value)}); }

}// namespace GTC
