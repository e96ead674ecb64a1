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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_TRAVERSALPARENT_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_TRAVERSALPARENT_HPP_

#include <Traversal/TraversalForwardRefs.hpp>
#include <vector>

namespace GTC {

/**
 * @brief Mixin of steps that own child traversals.
 * A local child only sees the current value of a traverser handed to it, a global child is a nested pipeline
 * that sees the full traverser context. A child traversal is owned by exactly one parent step.
 */
class TraversalParent {
  public:
    /**
     * @brief Releases the children that are still owned by this step, they become root traversals again.
     */
    virtual ~TraversalParent();

    [[nodiscard]] virtual std::vector<TraversalPtr> getLocalChildren() const;

    [[nodiscard]] virtual std::vector<TraversalPtr> getGlobalChildren() const;

    /**
     * @brief Returns the global children followed by the local children.
     */
    [[nodiscard]] std::vector<TraversalPtr> getChildren() const;

    /**
     * @brief Returns the step implementing this mixin.
     */
    Step* asStep();

    [[nodiscard]] const Step* asStep() const;

  protected:
    TraversalParent() = default;

    // a copied step owns clones of the children, never the children of the original
    TraversalParent(const TraversalParent&) {}

    TraversalParent& operator=(const TraversalParent&) = delete;

    /**
     * @brief Makes this step the parent of the child traversal.
     * @throws TraversalConstructionException if the child is empty or already owned by another step
     */
    void integrateChild(const TraversalPtr& child);

    /**
     * @brief Makes this step the parent of all children. Either every child is integrated or, if one of them is
     * rejected, none of them is.
     * @throws TraversalConstructionException if a child is empty or already owned by another step
     */
    void integrateChildren(const std::vector<TraversalPtr>& children);

  private:
    std::vector<std::weak_ptr<Traversal>> integratedChildren;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_TRAVERSALPARENT_HPP_
