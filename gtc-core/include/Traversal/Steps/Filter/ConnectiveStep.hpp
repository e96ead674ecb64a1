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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_CONNECTIVESTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_CONNECTIVESTEP_HPP_

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>
#include <Traversal/Steps/TraversalParent.hpp>
#include <vector>

namespace GTC {

class ConnectiveStep;
using ConnectiveStepPtr = std::shared_ptr<ConnectiveStep>;

class AndStep;
using AndStepPtr = std::shared_ptr<AndStep>;

class OrStep;
using OrStepPtr = std::shared_ptr<OrStep>;

/**
 * @brief Base class of the boolean combinators over local child traversals.
 */
class ConnectiveStep : public FilterStep, public TraversalParent {
  public:
    [[nodiscard]] std::vector<TraversalPtr> getLocalChildren() const override;

    void reset() override;

  protected:
    explicit ConnectiveStep(const std::vector<TraversalPtr>& traversals);

    ConnectiveStep(const ConnectiveStep& other);

    [[nodiscard]] std::vector<std::string> childStrings() const;

    std::vector<TraversalPtr> traversals;
};

/**
 * @brief Passes a traverser if every child traversal produces a result for it.
 */
class AndStep : public ConnectiveStep {
  public:
    explicit AndStep(const std::vector<TraversalPtr>& traversals);

    static AndStepPtr create(const std::vector<TraversalPtr>& traversals);

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    AndStep(const AndStep& other) = default;

    bool filter(const TraverserPtr& traverser) override;
};

/**
 * @brief Passes a traverser if at least one child traversal produces a result for it.
 */
class OrStep : public ConnectiveStep {
  public:
    explicit OrStep(const std::vector<TraversalPtr>& traversals);

    static OrStepPtr create(const std::vector<TraversalPtr>& traversals);

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    OrStep(const OrStep& other) = default;

    bool filter(const TraverserPtr& traverser) override;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_CONNECTIVESTEP_HPP_
