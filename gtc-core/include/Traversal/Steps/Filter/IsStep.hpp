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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_ISSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_ISSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>

namespace GTC {

class IsStep;
using IsStepPtr = std::shared_ptr<IsStep>;

/**
 * @brief Passes traversers whose value equals the given value.
 */
class IsStep : public FilterStep {
  public:
    explicit IsStep(Value value);

    static IsStepPtr create(Value value);

    [[nodiscard]] const Value& getValue() const;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    IsStep(const IsStep& other) = default;

    bool filter(const TraverserPtr& traverser) override;

  private:
    Value value;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_ISSTEP_HPP_
