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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_GRAPHSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_GRAPHSTEP_HPP_

#include <Traversal/Steps/Step.hpp>

namespace GTC {

class GraphStep;
using GraphStepPtr = std::shared_ptr<GraphStep>;

/**
 * @brief Emits all vertices of the graph of the root traversal.
 * As the first step it creates one traverser per vertex, in the middle of a traversal every incoming traverser is
 * split into one traverser per vertex.
 */
class GraphStep : public Step {
  public:
    GraphStep() = default;

    static GraphStepPtr create();

    [[nodiscard]] StepCapability getCapability() const override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    GraphStep(const GraphStep& other) = default;

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_GRAPHSTEP_HPP_
