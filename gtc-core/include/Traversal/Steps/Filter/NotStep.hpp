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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_NOTSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_NOTSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>
#include <Traversal/Steps/TraversalParent.hpp>

namespace GTC {

class NotStep;
using NotStepPtr = std::shared_ptr<NotStep>;

/**
 * @brief Passes a traverser if the local child traversal produces no result for it.
 */
class NotStep : public FilterStep, public TraversalParent {
  public:
    explicit NotStep(const TraversalPtr& notTraversal);

    static NotStepPtr create(const TraversalPtr& notTraversal);

    [[nodiscard]] std::vector<TraversalPtr> getLocalChildren() const override;

    void reset() override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    NotStep(const NotStep& other);

    bool filter(const TraverserPtr& traverser) override;

  private:
    TraversalPtr notTraversal;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_NOTSTEP_HPP_
