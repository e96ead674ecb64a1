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

#include <Exceptions/TraversalConstructionException.hpp>
#include <Traversal/Steps/Step.hpp>
#include <Traversal/Steps/TraversalParent.hpp>
#include <Traversal/Traversal.hpp>

namespace GTC {

std::vector<TraversalPtr> TraversalParent::getLocalChildren() const { return {}; }

std::vector<TraversalPtr> TraversalParent::getGlobalChildren() const { return {}; }

std::vector<TraversalPtr> TraversalParent::getChildren() const {
    auto children = getGlobalChildren();
    auto localChildren = getLocalChildren();
    children.insert(children.end(), localChildren.begin(), localChildren.end());
    return children;
}

Step* TraversalParent::asStep() { return dynamic_cast<Step*>(this); }

const Step* TraversalParent::asStep() const { return dynamic_cast<const Step*>(this); }

TraversalParent::~TraversalParent() {
    for (const auto& weakChild : integratedChildren) {
        auto child = weakChild.lock();
        if (child && child->getParent() == this) {
            child->setParent(nullptr);
        }
    }
}

void TraversalParent::integrateChild(const TraversalPtr& child) { integrateChildren({child}); }

void TraversalParent::integrateChildren(const std::vector<TraversalPtr>& children) {
    for (const auto& child : children) {
        if (!child) {
            throw Exceptions::TraversalConstructionException("Cannot integrate an empty child traversal");
        }
        if (child->getParent() != nullptr && child->getParent() != this) {
            throw Exceptions::TraversalConstructionException("The child traversal " + child->toString()
                                                             + " is already owned by another step");
        }
    }
    for (const auto& child : children) {
        child->setParent(this);
        integratedChildren.push_back(child);
    }
}

}// namespace GTC
