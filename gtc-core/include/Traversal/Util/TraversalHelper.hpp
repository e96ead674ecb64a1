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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_UTIL_TRAVERSALHELPER_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_UTIL_TRAVERSALHELPER_HPP_

#include <Traversal/Steps/TraversalParent.hpp>
#include <Traversal/Traversal.hpp>
#include <deque>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace GTC {

/**
 * @brief Structural operations on traversals used by the strategies.
 */
class TraversalHelper {
  public:
    /**
     * @brief Replaces a step by another one at the same position, the labels of the replaced step move to the replacement.
     * @param removeStep the step to replace
     * @param insertStep the replacement
     * @param traversal the traversal owning removeStep
     */
    static void replaceStep(const StepPtr& removeStep, const StepPtr& insertStep, Traversal& traversal);

    /**
     * @brief Inserts insertStep directly before afterStep.
     */
    static void insertBeforeStep(const StepPtr& insertStep, const StepPtr& afterStep, Traversal& traversal);

    /**
     * @brief Inserts insertStep directly after beforeStep.
     */
    static void insertAfterStep(const StepPtr& insertStep, const StepPtr& beforeStep, Traversal& traversal);

    /**
     * @brief Returns true if the root of the traversal runs on the distributed graph computer.
     */
    static bool onGraphComputer(const Traversal& traversal);

    /**
     * @brief Returns true if the traversal and all of its ancestors are global children (or the root).
     */
    static bool isGlobalChild(const Traversal& traversal);

    /**
     * @brief Returns true if the traversal or one of its ancestors is the local child of a step.
     */
    static bool isLocalChild(const Traversal& traversal);

    /**
     * @brief Returns the labels of all steps of the traversal and of all its children.
     */
    static std::set<std::string> getLabels(const TraversalPtr& traversal);

    /**
     * @brief Returns the traversal followed by all of its nested children in breadth-first order.
     */
    static std::vector<TraversalPtr> getTraversalsBreadthFirst(const TraversalPtr& traversal);

    /**
     * @brief Returns the steps that are instances of T in the traversal and all of its children.
     */
    template<class T>
    static std::vector<std::shared_ptr<T>> getStepsOfClassRecursively(const TraversalPtr& traversal) {
        std::vector<std::shared_ptr<T>> result;
        for (const auto& current : getTraversalsBreadthFirst(traversal)) {
            auto found = current->getStepsOfClass<T>();
            result.insert(result.end(), found.begin(), found.end());
        }
        return result;
    }

    /**
     * @brief Checks the structural invariants of the traversal and of all its children:
     * contiguous and correctly linked steps owned by the traversal, children owned by their parent step and
     * cached requirements that match the current steps.
     * @throws InvariantViolationException on the first violated invariant
     */
    static void verifyInvariants(const TraversalPtr& traversal);
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_UTIL_TRAVERSALHELPER_HPP_
