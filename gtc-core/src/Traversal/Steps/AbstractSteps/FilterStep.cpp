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

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>

namespace GTC {

StepCapability FilterStep::getCapability() const { return StepCapability::FILTER; }

std::vector<TraverserPtr> FilterStep::process(std::vector<TraverserPtr> traversers) {
    std::vector<TraverserPtr> output;
    for (auto& traverser : traversers) {
        if (filter(traverser)) {
            output.push_back(std::move(traverser));
        }
    }
    return output;
}

}// namespace GTC
