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

#include <Traversal/Steps/AbstractSteps/MapStep.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

StepCapability MapStep::getCapability() const { return StepCapability::MAP; }

std::vector<TraverserPtr> MapStep::process(std::vector<TraverserPtr> traversers) {
    std::vector<TraverserPtr> output;
    output.reserve(traversers.size());
    for (const auto& traverser : traversers) {
        output.push_back(traverser->split(map(traverser)));
    }
    return output;
}

}// namespace GTC
