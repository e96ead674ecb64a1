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

#include <Traversal/Steps/Filter/DedupGlobalStep.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

DedupGlobalStep::DedupGlobalStep(const DedupGlobalStep& other) : FilterStep(other) {}

DedupGlobalStepPtr DedupGlobalStep::create() { return std::make_shared<DedupGlobalStep>(); }

bool DedupGlobalStep::filter(const TraverserPtr& traverser) {
    if (!seenValues.insert(traverser->get()).second) {
        return false;
    }
    traverser->setBulk(1);
    return true;
}

void DedupGlobalStep::reset() { seenValues.clear(); }

StepPtr DedupGlobalStep::clone() const { return std::shared_ptr<DedupGlobalStep>(new DedupGlobalStep(*this)); }

std::string DedupGlobalStep::toString() const { return stepString("DedupGlobalStep"); }

}// namespace GTC
