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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSAL_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSAL_HPP_

#include <Structure/Graph.hpp>
#include <Traversal/SideEffects.hpp>
#include <Traversal/Steps/Step.hpp>
#include <Traversal/TraversalForwardRefs.hpp>
#include <Traversal/TraverserRequirement.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace GTC {

using StepPredicate = std::function<bool(const StepPtr&)>;

/**
 * @brief A traversal is an ordered pipeline of steps, i.e., a compiled graph query.
 * The traversal owns its steps and keeps their previous/next links consistent on every mutation.
 * A traversal may be the child of a step (see TraversalParent), in which case graph, side effects, strategies and the
 * execution mode are those of the root traversal.
 * Once the strategies are applied the traversal is locked and every further mutation is rejected.
 */
class Traversal : public std::enable_shared_from_this<Traversal> {
  public:
    Traversal();

    /**
     * @brief Creates an empty traversal.
     */
    static TraversalPtr create();

    /**
     * @brief Creates an empty traversal reading from the given graph.
     */
    static TraversalPtr create(GraphPtr graph);

    /**
     * @brief Appends a step to the end of the pipeline.
     * @throws TraversalConstructionException if the traversal is locked or the step belongs to another traversal
     */
    void addStep(const StepPtr& step);

    /**
     * @brief Inserts a step at the given position, the step at this position and its successors move back by one.
     * @throws TraversalConstructionException if the traversal is locked, the index is out of range or the step
     * belongs to another traversal
     */
    void addStep(size_t index, const StepPtr& step);

    /**
     * @brief Removes the step at the given position.
     * Labels of the removed step move to its successor unless the successor carries labels of its own.
     * A removed end step hands its labels to its predecessor under the same condition.
     * @throws TraversalConstructionException if the traversal is locked or the index is out of range
     */
    void removeStep(size_t index);

    void removeStep(const StepPtr& step);

    [[nodiscard]] const std::vector<StepPtr>& getSteps() const;

    /**
     * @brief Returns the steps of the given capability matching the predicate, in pipeline order.
     */
    [[nodiscard]] std::vector<StepPtr> getSteps(StepCapability capability, const StepPredicate& predicate = {}) const;

    /**
     * @brief Returns the steps matching the predicate, in pipeline order.
     */
    [[nodiscard]] std::vector<StepPtr> getSteps(const StepPredicate& predicate) const;

    /**
     * @brief Returns the steps that are instances of T, in pipeline order.
     */
    template<class T>
    [[nodiscard]] std::vector<std::shared_ptr<T>> getStepsOfClass() const {
        std::vector<std::shared_ptr<T>> result;
        for (const auto& step : steps) {
            if (step->instanceOf<T>()) {
                result.push_back(step->as<T>());
            }
        }
        return result;
    }

    /**
     * @brief Returns the position of the step or nullopt if the step is not part of this traversal.
     */
    [[nodiscard]] std::optional<size_t> indexOf(const StepPtr& step) const;

    /**
     * @brief Returns the first step or nullptr for an empty traversal.
     */
    [[nodiscard]] StepPtr getStartStep() const;

    /**
     * @brief Returns the last step or nullptr for an empty traversal.
     */
    [[nodiscard]] StepPtr getEndStep() const;

    [[nodiscard]] bool isEmpty() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Returns the step owning this traversal or nullptr for a root traversal.
     */
    [[nodiscard]] TraversalParent* getParent() const;

    void setParent(TraversalParent* newParent);

    [[nodiscard]] bool isRoot() const;

    /**
     * @brief Follows the parent steps up to the outermost traversal.
     */
    Traversal* getRootTraversal();

    [[nodiscard]] const Traversal* getRootTraversal() const;

    [[nodiscard]] SideEffectsPtr getSideEffects() const;

    void setSideEffects(SideEffectsPtr newSideEffects);

    [[nodiscard]] GraphPtr getGraph() const;

    void setGraph(GraphPtr newGraph);

    /**
     * @brief Returns the strategies applied when the traversal is compiled, nullptr selects the default strategies.
     */
    [[nodiscard]] TraversalStrategiesPtr getStrategies() const;

    void setStrategies(TraversalStrategiesPtr newStrategies);

    /**
     * @brief Returns true if the traversal is executed by the distributed graph computer.
     */
    [[nodiscard]] bool isOnGraphComputer() const;

    void setOnGraphComputer(bool graphComputer);

    /**
     * @brief Compiles the traversal with its strategies and locks it. Does nothing if the traversal is already locked.
     */
    void applyStrategies();

    /**
     * @brief Locks this traversal and all of its children.
     */
    void lock();

    [[nodiscard]] bool isLocked() const;

    /**
     * @brief Returns the fields a traverser needs to run through this traversal, including all children.
     * The set is cached until the next mutation of the traversal or of one of its children.
     */
    [[nodiscard]] TraverserRequirements getTraverserRequirements() const;

    /**
     * @brief Drops the cached requirements of this traversal and of all its ancestors.
     */
    void invalidateRequirements();

    /**
     * @brief Recomputes the requirements without touching the cache.
     */
    [[nodiscard]] TraverserRequirements computeTraverserRequirements() const;

    /**
     * @brief Returns true if a cached requirement set exists and differs from a fresh computation.
     */
    [[nodiscard]] bool hasStaleRequirements() const;

    /**
     * @brief Drives a batch of traversers through all steps in pipeline order.
     */
    std::vector<TraverserPtr> processTraversers(std::vector<TraverserPtr> traversers);

    /**
     * @brief Executes the traversal and returns all produced values, a traverser with bulk n contributes n values.
     * An unlocked traversal is compiled first.
     */
    std::vector<Value> toList();

    /**
     * @brief Clears the per-execution state of all steps.
     */
    void reset();

    /**
     * @brief Deep copy of the traversal, all steps and children are cloned and the side effects are copied.
     * The copy has no parent.
     */
    [[nodiscard]] TraversalPtr clone() const;

    [[nodiscard]] std::string toString() const;

    /**
     * @brief Structural equality: same step kinds in the same order with equal arguments, labels and children.
     */
    [[nodiscard]] bool equal(const TraversalPtr& other) const;

  private:
    void checkUnlocked(const std::string& operation) const;

    void relinkSteps();

    std::vector<StepPtr> steps;
    TraversalParent* parent{nullptr};
    SideEffectsPtr sideEffects;
    GraphPtr graph{nullptr};
    TraversalStrategiesPtr strategies{nullptr};
    bool onGraphComputer{false};
    bool locked{false};
    mutable std::optional<TraverserRequirements> requirements;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSAL_HPP_
