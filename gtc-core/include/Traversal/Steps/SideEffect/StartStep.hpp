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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_STARTSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_STARTSTEP_HPP_

#include <Traversal/Steps/Step.hpp>
#include <vector>

namespace GTC {

class StartStep;
using StartStepPtr = std::shared_ptr<StartStep>;

/**
 * @brief Source step of a traversal. It passes its input through and emits a traverser for each start value.
 * A start step without start values that carries exactly one label marks a variable, e.g., the a in as("a").out().
 */
class StartStep : public Step {
  public:
    explicit StartStep(std::vector<Value> startValues = {});

    static StartStepPtr create(std::vector<Value> startValues = {});

    /**
     * @brief Returns true if the step is a bare start step with a single label.
     */
    static bool isVariableStartStep(const StepPtr& step);

    [[nodiscard]] const std::vector<Value>& getStartValues() const;

    [[nodiscard]] StepCapability getCapability() const override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    StartStep(const StartStep& other) = default;

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;

  private:
    std::vector<Value> startValues;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_SIDEEFFECT_STARTSTEP_HPP_
