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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_BRANCH_UNIONSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_BRANCH_UNIONSTEP_HPP_

#include <Traversal/Steps/Step.hpp>
#include <Traversal/Steps/TraversalParent.hpp>
#include <vector>

namespace GTC {

class UnionStep;
using UnionStepPtr = std::shared_ptr<UnionStep>;

/**
 * @brief Feeds the complete input batch into every global child traversal and concatenates their outputs
 * in the order of the children.
 */
class UnionStep : public Step, public TraversalParent {
  public:
    explicit UnionStep(const std::vector<TraversalPtr>& unionTraversals);

    static UnionStepPtr create(const std::vector<TraversalPtr>& unionTraversals);

    [[nodiscard]] std::vector<TraversalPtr> getGlobalChildren() const override;

    [[nodiscard]] StepCapability getCapability() const override;

    void reset() override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    UnionStep(const UnionStep& other);

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;

  private:
    std::vector<TraversalPtr> unionTraversals;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_BRANCH_UNIONSTEP_HPP_
