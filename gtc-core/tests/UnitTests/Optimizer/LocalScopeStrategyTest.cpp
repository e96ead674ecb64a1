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

#include <GtcBaseTest.hpp>
#include <Optimizer/Strategies/LocalScopeStrategy.hpp>
#include <Traversal/Steps/Filter/WhereTraversalStep.hpp>
#include <Traversal/Steps/Map/LocalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/TestGraph.hpp>
#include <gtest/gtest.h>

namespace GTC {

using namespace Optimizer;

class LocalScopeStrategyTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("LocalScopeStrategyTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup LocalScopeStrategyTest test class.");
    }
};

TEST_F(LocalScopeStrategyTest, testLabelledBindingKeepsGlobalScope) {
    auto traversal = TraversalBuilder::start(Testing::TestGraph::createModern())
                         .V()
                         .as("a")
                         .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().build())
                         .build();
    LocalScopeStrategy::instance()->apply(traversal);

    EXPECT_EQ(traversal->getStepsOfClass<WhereTraversalStep>()[0]->getScope(), Scope::GLOBAL);
    EXPECT_TRUE(traversal->getTraverserRequirements().contains(TraverserRequirement::PATH));
}

TEST_F(LocalScopeStrategyTest, testSideEffectBindingSwitchesToLocalScope) {
    auto traversal = TraversalBuilder::start(Testing::TestGraph::createModern())
                         .withSideEffect("x", {Value(Vertex{1})})
                         .V()
                         .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("x").out().build())
                         .build();
    EXPECT_TRUE(traversal->getTraverserRequirements().contains(TraverserRequirement::PATH));

    LocalScopeStrategy::instance()->apply(traversal);

    auto whereStep = traversal->getStepsOfClass<WhereTraversalStep>()[0];
    EXPECT_EQ(whereStep->getScope(), Scope::LOCAL);
    EXPECT_EQ(whereStep->getWhereTraversal()->getStartStep()->as<WhereStartStep>()->getScope(), Scope::LOCAL);
    EXPECT_FALSE(traversal->getTraverserRequirements().contains(TraverserRequirement::PATH));

    // the binding of x has outgoing edges, every vertex passes
    EXPECT_EQ(traversal->toList().size(), 6U);
}

TEST_F(LocalScopeStrategyTest, testNestedWhereSeesLabelsOfTheRoot) {
    auto nested = TraversalBuilder::anonymous()
                      .out()
                      .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().build())
                      .build();
    auto traversal = TraversalBuilder::start(Testing::TestGraph::createModern()).V().as("a").local(nested).build();
    auto localTraversal = traversal->getStepsOfClass<LocalStep>()[0]->getLocalChildren()[0];
    LocalScopeStrategy::instance()->apply(localTraversal);

    EXPECT_EQ(localTraversal->getStepsOfClass<WhereTraversalStep>()[0]->getScope(), Scope::GLOBAL);
}

TEST_F(LocalScopeStrategyTest, testIdempotence) {
    auto traversal = TraversalBuilder::anonymous()
                         .withSideEffect("x", {Value(Vertex{1})})
                         .V()
                         .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("x").out().build())
                         .build();
    LocalScopeStrategy::instance()->apply(traversal);
    auto once = traversal->toString();
    LocalScopeStrategy::instance()->apply(traversal);
    EXPECT_EQ(once, traversal->toString());
}

}// namespace GTC
