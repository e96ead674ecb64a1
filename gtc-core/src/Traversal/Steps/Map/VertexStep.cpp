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

#include <Traversal/Steps/Map/VertexStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>
#include <magic_enum.hpp>

namespace GTC {

VertexStep::VertexStep(Direction direction, std::vector<std::string> edgeLabels)
    : direction(direction), edgeLabels(std::move(edgeLabels)) {}

VertexStepPtr VertexStep::create(Direction direction, std::vector<std::string> edgeLabels) {
    return std::make_shared<VertexStep>(direction, std::move(edgeLabels));
}

Direction VertexStep::getDirection() const { return direction; }

const std::vector<std::string>& VertexStep::getEdgeLabels() const { return edgeLabels; }

std::vector<Value> VertexStep::flatMap(const TraverserPtr& traverser) {
    const auto* vertex = std::get_if<Vertex>(&traverser->get());
    if (vertex == nullptr) {
        GTC_THROW_RUNTIME_ERROR("VertexStep: expected a vertex but received " << traverser->toString());
    }
    auto graph = traversal == nullptr ? nullptr : traversal->getGraph();
    if (!graph) {
        GTC_THROW_RUNTIME_ERROR("VertexStep: " << toString() << " is not part of a traversal with a graph");
    }
    std::vector<Value> result;
    for (const auto& adjacent : graph->adjacent(*vertex, direction, edgeLabels)) {
        result.emplace_back(adjacent);
    }
    return result;
}

StepPtr VertexStep::clone() const { return std::shared_ptr<VertexStep>(new VertexStep(*this)); }

std::string VertexStep::toString() const {
    std::vector<std::string> arguments{std::string(magic_enum::enum_name(direction))};
    arguments.insert(arguments.end(), edgeLabels.begin(), edgeLabels.end());
    return stepString("VertexStep", arguments);
}

}// namespace GTC
