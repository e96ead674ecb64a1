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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_COUNTGLOBALSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_COUNTGLOBALSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/ReducingBarrierStep.hpp>

namespace GTC {

class CountGlobalStep;
using CountGlobalStepPtr = std::shared_ptr<CountGlobalStep>;

/**
 * @brief Reduces all traversers to their number, taking the bulk of every traverser into account.
 */
class CountGlobalStep : public ReducingBarrierStep {
  public:
    CountGlobalStep() = default;

    static CountGlobalStepPtr create();

    [[nodiscard]] TraverserRequirements getRequirements() const override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    CountGlobalStep(const CountGlobalStep& other) = default;

    Value reduce(const std::vector<TraverserPtr>& traversers) override;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_COUNTGLOBALSTEP_HPP_
