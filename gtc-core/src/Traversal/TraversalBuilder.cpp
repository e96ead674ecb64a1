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

#include <Traversal/Steps/Branch/UnionStep.hpp>
#include <Traversal/Steps/Filter/ConnectiveStep.hpp>
#include <Traversal/Steps/Filter/DedupGlobalStep.hpp>
#include <Traversal/Steps/Filter/IdentityStep.hpp>
#include <Traversal/Steps/Filter/IsStep.hpp>
#include <Traversal/Steps/Filter/NotStep.hpp>
#include <Traversal/Steps/Filter/WhereTraversalStep.hpp>
#include <Traversal/Steps/Map/CountGlobalStep.hpp>
#include <Traversal/Steps/Map/LocalStep.hpp>
#include <Traversal/Steps/Map/VertexStep.hpp>
#include <Traversal/Steps/SideEffect/GraphStep.hpp>
#include <Traversal/Steps/SideEffect/StartStep.hpp>
#include <Traversal/Steps/SideEffect/StoreStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <utility>

namespace GTC {

TraversalBuilder::TraversalBuilder(TraversalPtr traversal) : traversal(std::move(traversal)) {}

TraversalBuilder TraversalBuilder::start(GraphPtr graph) { return TraversalBuilder(Traversal::create(std::move(graph))); }

TraversalBuilder TraversalBuilder::anonymous() { return TraversalBuilder(Traversal::create()); }

TraversalBuilder& TraversalBuilder::inject(std::vector<Value> values) {
    traversal->addStep(StartStep::create(std::move(values)));
    return *this;
}

TraversalBuilder& TraversalBuilder::V() {
    traversal->addStep(GraphStep::create());
    return *this;
}

TraversalBuilder& TraversalBuilder::as(const std::string& label) {
    if (traversal->isEmpty()) {
        traversal->addStep(StartStep::create());
    }
    traversal->getEndStep()->addLabel(label);
    return *this;
}

TraversalBuilder& TraversalBuilder::out(std::vector<std::string> edgeLabels) {
    traversal->addStep(VertexStep::create(Direction::OUT, std::move(edgeLabels)));
    return *this;
}

TraversalBuilder& TraversalBuilder::in(std::vector<std::string> edgeLabels) {
    traversal->addStep(VertexStep::create(Direction::IN, std::move(edgeLabels)));
    return *this;
}

TraversalBuilder& TraversalBuilder::both(std::vector<std::string> edgeLabels) {
    traversal->addStep(VertexStep::create(Direction::BOTH, std::move(edgeLabels)));
    return *this;
}

TraversalBuilder& TraversalBuilder::identity() {
    traversal->addStep(IdentityStep::create());
    return *this;
}

TraversalBuilder& TraversalBuilder::dedup() {
    traversal->addStep(DedupGlobalStep::create());
    return *this;
}

TraversalBuilder& TraversalBuilder::count() {
    traversal->addStep(CountGlobalStep::create());
    return *this;
}

TraversalBuilder& TraversalBuilder::is(Value value) {
    traversal->addStep(IsStep::create(std::move(value)));
    return *this;
}

TraversalBuilder& TraversalBuilder::store(const std::string& sideEffectKey) {
    traversal->addStep(StoreStep::create(sideEffectKey));
    return *this;
}

TraversalBuilder& TraversalBuilder::local(const TraversalPtr& localTraversal) {
    traversal->addStep(LocalStep::create(localTraversal));
    return *this;
}

TraversalBuilder& TraversalBuilder::union_(const std::vector<TraversalPtr>& unionTraversals) {
    traversal->addStep(UnionStep::create(unionTraversals));
    return *this;
}

TraversalBuilder& TraversalBuilder::and_(const std::vector<TraversalPtr>& traversals) {
    traversal->addStep(AndStep::create(traversals));
    return *this;
}

TraversalBuilder& TraversalBuilder::or_(const std::vector<TraversalPtr>& traversals) {
    traversal->addStep(OrStep::create(traversals));
    return *this;
}

TraversalBuilder& TraversalBuilder::not_(const TraversalPtr& notTraversal) {
    traversal->addStep(NotStep::create(notTraversal));
    return *this;
}

TraversalBuilder& TraversalBuilder::where(Scope scope, const TraversalPtr& whereTraversal) {
    traversal->addStep(WhereTraversalStep::create(scope, whereTraversal));
    return *this;
}

TraversalBuilder& TraversalBuilder::where(const TraversalPtr& whereTraversal) { return where(Scope::GLOBAL, whereTraversal); }

TraversalBuilder& TraversalBuilder::withSideEffect(const std::string& key, std::vector<Value> values) {
    auto sideEffects = traversal->getSideEffects();
    sideEffects->set(key, std::move(values));
    traversal->invalidateRequirements();
    return *this;
}

TraversalBuilder& TraversalBuilder::withGraphComputer(bool graphComputer) {
    traversal->setOnGraphComputer(graphComputer);
    return *this;
}

TraversalBuilder& TraversalBuilder::withStrategies(TraversalStrategiesPtr strategies) {
    traversal->setStrategies(std::move(strategies));
    return *this;
}

TraversalPtr TraversalBuilder::build() { return std::move(traversal); }

}// namespace GTC
