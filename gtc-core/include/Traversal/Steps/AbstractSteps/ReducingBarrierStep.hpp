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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_ABSTRACTSTEPS_REDUCINGBARRIERSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_ABSTRACTSTEPS_REDUCINGBARRIERSTEP_HPP_

#include <Traversal/Steps/Step.hpp>

namespace GTC {

/**
 * @brief A step that consumes its whole input batch and emits a single traverser holding the reduced value.
 * An empty input still produces the reduction of nothing, e.g., a count of 0.
 */
class ReducingBarrierStep : public Step {
  public:
    [[nodiscard]] StepCapability getCapability() const override;

  protected:
    ReducingBarrierStep() = default;

    ReducingBarrierStep(const ReducingBarrierStep& other) = default;

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;

    virtual Value reduce(const std::vector<TraverserPtr>& traversers) = 0;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_ABSTRACTSTEPS_REDUCINGBARRIERSTEP_HPP_
