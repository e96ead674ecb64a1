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
#include <Optimizer/Strategies/DedupCountStrategy.hpp>
#include <Optimizer/Strategies/IdentityRemovalStrategy.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Steps/Branch/UnionStep.hpp>
#include <Traversal/Steps/Filter/DedupGlobalStep.hpp>
#include <Traversal/Steps/Map/CountGlobalStep.hpp>
#include <Traversal/Steps/Map/DedupCountGlobalStep.hpp>
#include <Traversal/Steps/Map/LocalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/TestGraph.hpp>
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <vector>

namespace GTC {

using namespace Optimizer;

class DedupCountStrategyTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("DedupCountStrategyTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup DedupCountStrategyTest test class.");
    }

    void SetUp() override {
        Testing::BaseUnitTest::SetUp();
        graph = Testing::TestGraph::createModern();
        strategies = TraversalStrategies::create({DedupCountStrategy::instance(), IdentityRemovalStrategy::instance()});
    }

    GraphPtr graph;
    TraversalStrategiesPtr strategies;
};

TEST_F(DedupCountStrategyTest, testFuseDedupAndCountOnGraphComputer) {
    auto traversal = TraversalBuilder::start(graph).withGraphComputer().V().out().dedup().count().build();
    strategies->applyStrategies(traversal);

    ASSERT_EQ(traversal->size(), 3U);
    ASSERT_INSTANCE_OF(traversal->getEndStep(), DedupCountGlobalStep);
    EXPECT_TRUE(traversal->getStepsOfClass<DedupGlobalStep>().empty());
    EXPECT_TRUE(traversal->getStepsOfClass<CountGlobalStep>().empty());
    EXPECT_EQ(traversal->toList(), std::vector<Value>{Value(int64_t{4})});
}

TEST_F(DedupCountStrategyTest, testFusedStepCountsDistinctInjectedValues) {
    std::vector<std::vector<Value>> inputs = {
        {},
        {Value(int64_t{7})},
        {Value(int64_t{3}), Value(int64_t{3}), Value(int64_t{3}), Value(int64_t{3})},
        {Value(std::string("a")), Value(std::string("a"))},
        {Value(int64_t{1}), Value(int64_t{2}), Value(int64_t{2}), Value(int64_t{3}), Value(int64_t{1})},
        {Value(int64_t{1}), Value(1.0), Value(std::string("1")), Value(true), Value(int64_t{1}), Value(Vertex{1})},
    };
    for (const auto& input : inputs) {
        std::unordered_set<Value> distinct(input.begin(), input.end());
        auto traversal = TraversalBuilder::anonymous().withGraphComputer().inject(input).dedup().count().build();
        strategies->applyStrategies(traversal);

        EXPECT_EQ(traversal->getStepsOfClass<DedupCountGlobalStep>().size(), 1U) << traversal->toString();
        EXPECT_TRUE(traversal->getStepsOfClass<DedupGlobalStep>().empty());
        EXPECT_TRUE(traversal->getStepsOfClass<CountGlobalStep>().empty());
        EXPECT_EQ(traversal->toList(), std::vector<Value>{Value(static_cast<int64_t>(distinct.size()))})
            << "input of " << input.size() << " values";
    }
}

TEST_F(DedupCountStrategyTest, testNoFusionOutsideOfGraphComputer) {
    auto traversal = TraversalBuilder::start(graph).V().out().dedup().count().build();
    strategies->applyStrategies(traversal);

    ASSERT_EQ(traversal->size(), 4U);
    EXPECT_EQ(traversal->getStepsOfClass<DedupGlobalStep>().size(), 1U);
    EXPECT_EQ(traversal->getStepsOfClass<CountGlobalStep>().size(), 1U);
    EXPECT_EQ(traversal->toList(), std::vector<Value>{Value(int64_t{4})});
}

TEST_F(DedupCountStrategyTest, testIdentityBetweenDedupAndCountIsRemovedFirst) {
    auto traversal = TraversalBuilder::start(graph).withGraphComputer().V().out().dedup().identity().count().build();
    strategies->applyStrategies(traversal);

    ASSERT_EQ(traversal->size(), 3U);
    ASSERT_INSTANCE_OF(traversal->getEndStep(), DedupCountGlobalStep);
}

TEST_F(DedupCountStrategyTest, testLabelsOfCountMoveToFusedStep) {
    auto traversal = TraversalBuilder::start(graph).withGraphComputer().V().out().dedup().count().as("c").build();
    strategies->applyStrategies(traversal);

    ASSERT_INSTANCE_OF(traversal->getEndStep(), DedupCountGlobalStep);
    EXPECT_EQ(traversal->getEndStep()->getLabels(), std::set<std::string>{"c"});
}

TEST_F(DedupCountStrategyTest, testLabelledDedupIsKept) {
    auto traversal = TraversalBuilder::start(graph).withGraphComputer().V().out().dedup().as("d").count().build();
    strategies->applyStrategies(traversal);

    EXPECT_EQ(traversal->getStepsOfClass<DedupGlobalStep>().size(), 1U);
    EXPECT_TRUE(traversal->getStepsOfClass<DedupCountGlobalStep>().empty());
}

TEST_F(DedupCountStrategyTest, testLocalChildIsNotFused) {
    auto traversal = TraversalBuilder::start(graph)
                         .withGraphComputer()
                         .V()
                         .local(TraversalBuilder::anonymous().out().dedup().count().build())
                         .build();
    strategies->applyStrategies(traversal);

    auto localTraversal = traversal->getStepsOfClass<LocalStep>()[0]->getLocalChildren()[0];
    EXPECT_EQ(localTraversal->getStepsOfClass<DedupGlobalStep>().size(), 1U);
    EXPECT_EQ(localTraversal->getStepsOfClass<CountGlobalStep>().size(), 1U);
}

TEST_F(DedupCountStrategyTest, testGlobalChildIsFused) {
    auto traversal = TraversalBuilder::start(graph)
                         .withGraphComputer()
                         .V()
                         .union_({TraversalBuilder::anonymous().out().dedup().count().build()})
                         .build();
    strategies->applyStrategies(traversal);

    auto unionTraversal = traversal->getStepsOfClass<UnionStep>()[0]->getGlobalChildren()[0];
    ASSERT_EQ(unionTraversal->size(), 2U);
    ASSERT_INSTANCE_OF(unionTraversal->getEndStep(), DedupCountGlobalStep);
}

TEST_F(DedupCountStrategyTest, testIdempotence) {
    auto traversal = TraversalBuilder::start(graph).withGraphComputer().V().out().dedup().count().build();
    DedupCountStrategy::instance()->apply(traversal);
    auto once = traversal->toString();
    DedupCountStrategy::instance()->apply(traversal);
    EXPECT_EQ(once, traversal->toString());
}

}// namespace GTC
