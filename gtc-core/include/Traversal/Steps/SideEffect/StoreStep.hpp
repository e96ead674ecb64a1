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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_STORESTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_STORESTEP_HPP_

#include <Traversal/Steps/AbstractSteps/SideEffectStep.hpp>
#include <string>

namespace GTC {

class StoreStep;
using StoreStepPtr = std::shared_ptr<StoreStep>;

/**
 * @brief Appends the value of every traverser to the side-effect list stored under a key, once per bulk.
 */
class StoreStep : public SideEffectStep {
  public:
    explicit StoreStep(std::string sideEffectKey);

    static StoreStepPtr create(const std::string& sideEffectKey);

    [[nodiscard]] const std::string& getSideEffectKey() const;

    [[nodiscard]] TraverserRequirements getRequirements() const override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    StoreStep(const StoreStep& other) = default;

    void sideEffect(const TraverserPtr& traverser) override;

  private:
    std::string sideEffectKey;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_STORESTEP_HPP_
