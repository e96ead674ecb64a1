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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_LOCALSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_LOCALSTEP_HPP_

#include <Traversal/Steps/Step.hpp>
#include <Traversal/Steps/TraversalParent.hpp>

namespace GTC {

class LocalStep;
using LocalStepPtr = std::shared_ptr<LocalStep>;

/**
 * @brief Runs the local child traversal separately for every incoming traverser and emits everything it produces.
 */
class LocalStep : public Step, public TraversalParent {
  public:
    explicit LocalStep(const TraversalPtr& localTraversal);

    static LocalStepPtr create(const TraversalPtr& localTraversal);

    [[nodiscard]] std::vector<TraversalPtr> getLocalChildren() const override;

    [[nodiscard]] StepCapability getCapability() const override;

    void reset() override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    LocalStep(const LocalStep& other);

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;

  private:
    TraversalPtr localTraversal;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_MAP_LOCALSTEP_HPP_
