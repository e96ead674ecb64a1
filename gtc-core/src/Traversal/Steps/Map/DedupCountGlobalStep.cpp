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

#include <Traversal/Steps/Map/DedupCountGlobalStep.hpp>
#include <Traversal/Traverser.hpp>
#include <unordered_set>

namespace GTC {

DedupCountGlobalStepPtr DedupCountGlobalStep::create() { return std::make_shared<DedupCountGlobalStep>(); }

Value DedupCountGlobalStep::reduce(const std::vector<TraverserPtr>& traversers) {
    std::unordered_set<Value> distinctValues;
    for (const auto& traverser : traversers) {
        distinctValues.insert(traverser->get());
    }
    return static_cast<int64_t>(distinctValues.size());
}

StepPtr DedupCountGlobalStep::clone() const { return std::shared_ptr<DedupCountGlobalStep>(new DedupCountGlobalStep(*this)); }

std::string DedupCountGlobalStep::toString() const { return stepString("DedupCountGlobalStep"); }

}// namespace GTC
