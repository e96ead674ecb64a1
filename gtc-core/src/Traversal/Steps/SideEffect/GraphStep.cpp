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

#include <Traversal/Steps/SideEffect/GraphStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

GraphStepPtr GraphStep::create() { return std::make_shared<GraphStep>(); }

StepCapability GraphStep::getCapability() const { return StepCapability::SIDE_EFFECT; }

std::vector<TraverserPtr> GraphStep::process(std::vector<TraverserPtr> traversers) {
    auto graph = traversal == nullptr ? nullptr : traversal->getGraph();
    if (!graph) {
        GTC_THROW_RUNTIME_ERROR("GraphStep: the traversal " << (traversal ? traversal->toString() : "") << " has no graph");
    }
    std::vector<TraverserPtr> output;
    auto vertices = graph->vertices();
    if (getPreviousStep() == nullptr && traversers.empty()) {
        for (const auto& vertex : vertices) {
            output.push_back(generateTraverser(vertex));
        }
        return output;
    }
    for (const auto& traverser : traversers) {
        for (const auto& vertex : vertices) {
            output.push_back(traverser->split(vertex));
        }
    }
    return output;
}

StepPtr GraphStep::clone() const { return std::shared_ptr<GraphStep>(new GraphStep(*this)); }

std::string GraphStep::toString() const { return stepString("GraphStep", {"vertex"}); }

}// namespace GTC
