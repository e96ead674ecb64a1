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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_DEDUPCOUNTGLOBALSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_DEDUPCOUNTGLOBALSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/ReducingBarrierStep.hpp>

namespace GTC {

class DedupCountGlobalStep;
using DedupCountGlobalStepPtr = std::shared_ptr<DedupCountGlobalStep>;

/**
 * @brief Reduces all traversers to the number of distinct values in a single pass.
 * Equivalent to a DedupGlobalStep directly followed by a CountGlobalStep.
 */
class DedupCountGlobalStep : public ReducingBarrierStep {
  public:
    DedupCountGlobalStep() = default;

    static DedupCountGlobalStepPtr create();

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    DedupCountGlobalStep(const DedupCountGlobalStep& other) = default;

    Value reduce(const std::vector<TraverserPtr>& traversers) override;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_DEDUPCOUNTGLOBALSTEP_HPP_
