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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_DEDUPGLOBALSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_DEDUPGLOBALSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>
#include <unordered_set>

namespace GTC {

class DedupGlobalStep;
using DedupGlobalStepPtr = std::shared_ptr<DedupGlobalStep>;

/**
 * @brief Passes the first traverser of every distinct value, with a bulk of one.
 * The values seen so far are per-execution state.
 */
class DedupGlobalStep : public FilterStep {
  public:
    DedupGlobalStep() = default;

    static DedupGlobalStepPtr create();

    void reset() override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    DedupGlobalStep(const DedupGlobalStep& other);

    bool filter(const TraverserPtr& traverser) override;

  private:
    std::unordered_set<Value> seenValues;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_DEDUPGLOBALSTEP_HPP_
