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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_WHERETRAVERSALSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_WHERETRAVERSALSTEP_HPP_

#include <Traversal/Steps/AbstractSteps/FilterStep.hpp>
#include <Traversal/Steps/Scoping.hpp>
#include <Traversal/Steps/TraversalParent.hpp>
#include <optional>
#include <set>
#include <string>

namespace GTC {

class WhereTraversalStep;
using WhereTraversalStepPtr = std::shared_ptr<WhereTraversalStep>;

class WhereStartStep;
using WhereStartStepPtr = std::shared_ptr<WhereStartStep>;

class WhereEndStep;
using WhereEndStepPtr = std::shared_ptr<WhereEndStep>;

/**
 * @brief Filter correlated with the enclosing traversal through the labels of its child traversal.
 *
 * The child traversal is rewritten at construction:
 *  1.) A variable start (e.g., as("a").out()) is replaced by a WhereStartStep bound to "a", which continues with the
 *      value bound to "a" instead of the incoming value.
 *  2.) Otherwise, if the end step carries a label, a pass-through WhereStartStep is put in front.
 *  3.) A label on the end step (e.g., out().as("b")) is stripped and a WhereEndStep bound to "b" is appended, which only
 *      passes values equal to the binding of "b" of the incoming traverser.
 * Children of and/or/not steps at the start of the child traversal are rewritten the same way.
 * A traverser passes the filter if the rewritten child produces at least one result for it.
 */
class WhereTraversalStep : public FilterStep, public TraversalParent, public Scoping {
  public:
    /**
     * @brief Creates the filter on a copy of the given child traversal, the argument is not modified.
     * @param scope LOCAL or GLOBAL
     * @param whereTraversal the child traversal
     * @throws TraversalConstructionException if the child has neither a start nor an end label or if its end step
     * carries more than one label
     */
    WhereTraversalStep(Scope scope, const TraversalPtr& whereTraversal);

    static WhereTraversalStepPtr create(Scope scope, const TraversalPtr& whereTraversal);

    [[nodiscard]] const TraversalPtr& getWhereTraversal() const;

    [[nodiscard]] std::vector<TraversalPtr> getLocalChildren() const override;

    [[nodiscard]] std::set<std::string> getScopeKeys() const override;

    [[nodiscard]] Scope getScope() const override;

    /**
     * @brief Changes the scope of the filter and of its start markers.
     */
    void setScope(Scope newScope) override;

    [[nodiscard]] TraverserRequirements getRequirements() const override;

    void reset() override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    WhereTraversalStep(const WhereTraversalStep& other);

    bool filter(const TraverserPtr& traverser) override;

  private:
    void configureStartAndEndSteps();

    Scope scope;
    std::set<std::string> scopeKeys;
    TraversalPtr whereTraversal;
};

/**
 * @brief First step of a where()-child. Without a select key it passes the incoming traverser through,
 * with a select key it continues with the value bound to the key and drops traversers without such a binding.
 * It also hands every traverser to a WhereEndStep at the end of the same traversal.
 */
class WhereStartStep : public Step, public Scoping {
  public:
    WhereStartStep(std::optional<std::string> selectKey, Scope scope);

    static WhereStartStepPtr create(std::optional<std::string> selectKey, Scope scope);

    [[nodiscard]] const std::optional<std::string>& getSelectKey() const;

    [[nodiscard]] std::set<std::string> getScopeKeys() const override;

    [[nodiscard]] Scope getScope() const override;

    void setScope(Scope newScope) override;

    [[nodiscard]] StepCapability getCapability() const override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    WhereStartStep(const WhereStartStep& other) = default;

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;

  private:
    std::optional<std::string> selectKey;
    Scope scope;
};

/**
 * @brief Last step of a where()-child. Passes a traverser if it has no match key or if the value of the traverser
 * equals the binding of the match key captured from the traverser that entered the child.
 * The scope is fixed at construction.
 */
class WhereEndStep : public FilterStep, public Scoping {
  public:
    WhereEndStep(std::optional<std::string> matchKey, Scope scope);

    static WhereEndStepPtr create(std::optional<std::string> matchKey, Scope scope);

    /**
     * @brief Captures the binding of the match key from the traverser entering the child traversal.
     */
    void processStartTraverser(const TraverserPtr& traverser);

    [[nodiscard]] const std::optional<std::string>& getMatchKey() const;

    [[nodiscard]] std::set<std::string> getScopeKeys() const override;

    [[nodiscard]] Scope getScope() const override;

    /**
     * @brief Ignored, the scope of the end marker cannot change after construction.
     */
    void setScope(Scope newScope) override;

    void reset() override;

    [[nodiscard]] StepPtr clone() const override;

    [[nodiscard]] std::string toString() const override;

  protected:
    WhereEndStep(const WhereEndStep& other);

    bool filter(const TraverserPtr& traverser) override;

  private:
    std::optional<std::string> matchKey;
    const Scope scope;
    std::optional<Value> matchValue;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_FILTER_WHERETRAVERSALSTEP_HPP_
