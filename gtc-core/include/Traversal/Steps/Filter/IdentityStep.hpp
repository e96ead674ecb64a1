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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_IDENTITYSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_IDENTITYSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>

namespace GTC {

class IdentityStep;
using IdentityStepPtr = std::shared_ptr<IdentityStep>;

/**
 * @brief Passes every traverser. Mostly a carrier for labels, removed by the IdentityRemovalStrategy.
 */
class IdentityStep : public FilterStep {
  public:
    IdentityStep() = default;

    static IdentityStepPtr create();

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    IdentityStep(const IdentityStep& other) = default;

    bool filter(const TraverserPtr& traverser) override;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_IDENTITYSTEP_HPP_
