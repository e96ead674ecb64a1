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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_STEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_STEP_HPP_

#include <Structure/Value.hpp>
#include <Traversal/TraversalForwardRefs.hpp>
#include <Traversal/TraverserRequirement.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/UtilityFunctions.hpp>
#include <memory>
#include <set>
#include <string>
#include <typeinfo>
#include <vector>

namespace GTC {

/**
 * @brief The capability kind of a step. Strategies use it to look up rewrite targets.
 */
enum class StepCapability : uint8_t {
    // produces one or more output values per input traverser
    MAP,
    // passes or rejects input traversers without changing their value
    FILTER,
    // passes input traversers unchanged and mutates external state, sources are side effect steps as well
    SIDE_EFFECT,
    // consumes all input traversers before it produces its output
    BARRIER
};

/**
 * @brief A unit of computation in a traversal pipeline.
 * A step is owned by exactly one traversal which keeps the previous/next links of all its steps consistent.
 * Steps may keep per-execution state, which is cleared by reset().
 */
class Step : public std::enable_shared_from_this<Step> {
  public:
    virtual ~Step() = default;

    /**
     * @brief Unique identifier of the step. Clones keep the id of their origin.
     */
    [[nodiscard]] StepId getId() const;

    [[nodiscard]] const std::set<std::string>& getLabels() const;

    [[nodiscard]] bool hasLabels() const;

    void addLabel(const std::string& label);

    void removeLabel(const std::string& label);

    void clearLabels();

    [[nodiscard]] StepPtr getNextStep() const;

    [[nodiscard]] StepPtr getPreviousStep() const;

    void setNextStep(const StepPtr& step);

    void setPreviousStep(const StepPtr& step);

    /**
     * @brief Returns the traversal owning this step or nullptr if the step is not yet part of a traversal.
     */
    [[nodiscard]] Traversal* getTraversal() const;

    /**
     * @brief Sets the owning traversal. Only to be called by the traversal adding or removing the step.
     */
    virtual void setTraversal(Traversal* owner);

    [[nodiscard]] virtual StepCapability getCapability() const = 0;

    /**
     * @brief Returns the traverser fields this step relies on.
     */
    [[nodiscard]] virtual TraverserRequirements getRequirements() const;

    /**
     * @brief Drives a batch of traversers through this step and records the step labels on the produced traversers.
     * @param traversers the input batch
     * @return the output batch
     */
    std::vector<TraverserPtr> processTraversers(std::vector<TraverserPtr> traversers);

    /**
     * @brief Clears the per-execution state of the step.
     */
    virtual void reset();

    /**
     * @brief Creates a deep copy of this step that is not linked to any traversal.
     */
    [[nodiscard]] virtual StepPtr clone() const = 0;

    [[nodiscard]] virtual std::string toString() const = 0;

    /**
     * @brief Checks if two steps are structurally equal, i.e., have the same kind, arguments, labels and children.
     */
    [[nodiscard]] virtual bool equal(const StepPtr& other) const;

    /**
     * @brief Checks if the step is an instance of T.
     */
    template<class T>
    [[nodiscard]] bool instanceOf() const {
        return dynamic_cast<const T*>(this) != nullptr;
    }

    /**
     * @brief Casts the step to T.
     * @throws RuntimeException if the step is not an instance of T
     */
    template<class T>
    std::shared_ptr<T> as() {
        if (instanceOf<T>()) {
            return std::dynamic_pointer_cast<T>(this->shared_from_this());
        }
        GTC_THROW_RUNTIME_ERROR("Step: exception while casting " << toString() << " to " << typeid(T).name());
    }

  protected:
    Step();

    Step(const Step& other);

    Step& operator=(const Step&) = delete;

    virtual std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) = 0;

    /**
     * @brief Creates a fresh traverser with the requirements and side effects of the root traversal.
     */
    [[nodiscard]] TraverserPtr generateTraverser(Value value, uint64_t bulk = 1) const;

    /**
     * @brief Renders the step as Name(arg1,arg2)@[label1, label2].
     */
    [[nodiscard]] std::string stepString(const std::string& name, const std::vector<std::string>& arguments = {}) const;

    StepId id;
    std::set<std::string> labels;
    std::weak_ptr<Step> previousStep;
    std::weak_ptr<Step> nextStep;
    Traversal* traversal{nullptr};
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_STEP_HPP_
