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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_VERTEXSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_VERTEXSTEP_HPP_

#include <Structure/Graph.hpp>
#include <Traversal/Steps/AbstractSteps/FlatMapStep.hpp>
#include <string>
#include <vector>

namespace GTC {

class VertexStep;
using VertexStepPtr = std::shared_ptr<VertexStep>;

/**
 * @brief Moves from a vertex to its adjacent vertices, following the edges in the given direction.
 */
class VertexStep : public FlatMapStep {
  public:
    VertexStep(Direction direction, std::vector<std::string> edgeLabels);

    static VertexStepPtr create(Direction direction, std::vector<std::string> edgeLabels = {});

    [[nodiscard]] Direction getDirection() const;

    [[nodiscard]] const std::vector<std::string>& getEdgeLabels() const;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    VertexStep(const VertexStep& other) = default;

    std::vector<Value> flatMap(const TraverserPtr& traverser) override;

  private:
    Direction direction;
    std::vector<std::string> edgeLabels;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_VERTEXSTEP_HPP_
