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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSALBUILDER_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSALBUILDER_HPP_

#include <Structure/Graph.hpp>
#include <Structure/Value.hpp>
#include <Traversal/Scope.hpp>
#include <Traversal/TraversalForwardRefs.hpp>
#include <string>
#include <vector>

namespace GTC {

/**
 * @brief Fluent API to assemble an unoptimized traversal step by step, e.g.,
 * TraversalBuilder::start(graph).V().as("a").out().where(Scope::GLOBAL, child).build().
 * Child traversals are assembled with TraversalBuilder::anonymous().
 */
class TraversalBuilder {
  public:
    /**
     * @brief Starts a root traversal reading from the given graph.
     */
    static TraversalBuilder start(GraphPtr graph);

    /**
     * @brief Starts a child traversal, the graph is taken from the root it is nested in.
     */
    static TraversalBuilder anonymous();

    TraversalBuilder& inject(std::vector<Value> values);

    TraversalBuilder& V();

    /**
     * @brief Labels the current end step. An empty traversal receives a start step first, so anonymous().as("a")
     * denotes a variable.
     */
    TraversalBuilder& as(const std::string& label);

    TraversalBuilder& out(std::vector<std::string> edgeLabels = {});

    TraversalBuilder& in(std::vector<std::string> edgeLabels = {});

    TraversalBuilder& both(std::vector<std::string> edgeLabels = {});

    TraversalBuilder& identity();

    TraversalBuilder& dedup();

    TraversalBuilder& count();

    TraversalBuilder& is(Value value);

    TraversalBuilder& store(const std::string& sideEffectKey);

    TraversalBuilder& local(const TraversalPtr& localTraversal);

    TraversalBuilder& union_(const std::vector<TraversalPtr>& unionTraversals);

    TraversalBuilder& and_(const std::vector<TraversalPtr>& traversals);

    TraversalBuilder& or_(const std::vector<TraversalPtr>& traversals);

    TraversalBuilder& not_(const TraversalPtr& notTraversal);

    /**
     * @brief Adds a filter correlated with the labels of the child traversal.
     * @throws TraversalConstructionException if the child references no label, the traversal stays unchanged
     */
    TraversalBuilder& where(Scope scope, const TraversalPtr& whereTraversal);

    TraversalBuilder& where(const TraversalPtr& whereTraversal);

    TraversalBuilder& withSideEffect(const std::string& key, std::vector<Value> values);

    TraversalBuilder& withGraphComputer(bool graphComputer = true);

    TraversalBuilder& withStrategies(TraversalStrategiesPtr strategies);

    /**
     * @brief Returns the assembled traversal. The builder must not be used afterwards.
     */
    TraversalPtr build();

  private:
    explicit TraversalBuilder(TraversalPtr traversal);

    TraversalPtr traversal;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSALBUILDER_HPP_
