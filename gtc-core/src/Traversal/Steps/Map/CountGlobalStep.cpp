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

#include <Traversal/Steps/Map/CountGlobalStep.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

CountGlobalStepPtr CountGlobalStep::create() { return std::make_shared<CountGlobalStep>(); }

TraverserRequirements CountGlobalStep::getRequirements() const { return {TraverserRequirement::BULK}; }

Value CountGlobalStep::reduce(const std::vector<TraverserPtr>& traversers) {
    int64_t count = 0;
    for (const auto& traverser : traversers) {
        count += static_cast<int64_t>(traverser->getBulk());
    }
    return count;
}

StepPtr CountGlobalStep::clone() const { return std::shared_ptr<CountGlobalStep>(new CountGlobalStep(*this)); }

std::string CountGlobalStep::toString() const { return stepString("CountGlobalStep"); }

}// namespace GTC
