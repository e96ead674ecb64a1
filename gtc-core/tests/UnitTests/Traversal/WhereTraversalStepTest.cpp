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
#include <GtcBaseTest.hpp>
#include <Traversal/Steps/Filter/ConnectiveStep.hpp>
#include <Traversal/Steps/Filter/WhereTraversalStep.hpp>
#include <Traversal/Steps/Map/VertexStep.hpp>
#include <Traversal/Steps/SideEffect/StartStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Traversal/Util/TraversalHelper.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/TestGraph.hpp>
#include <gtest/gtest.h>

namespace GTC {

class WhereTraversalStepTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("WhereTraversalStepTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup WhereTraversalStepTest test class.");
    }

    /**
     * Collects the keys bound by the start and end markers of a rewritten where()-child.
     */
    static std::set<std::string> markerKeys(const TraversalPtr& whereTraversal) {
        std::set<std::string> keys;
        for (const auto& startStep : TraversalHelper::getStepsOfClassRecursively<WhereStartStep>(whereTraversal)) {
            auto startKeys = startStep->getScopeKeys();
            keys.insert(startKeys.begin(), startKeys.end());
        }
        for (const auto& endStep : TraversalHelper::getStepsOfClassRecursively<WhereEndStep>(whereTraversal)) {
            auto endKeys = endStep->getScopeKeys();
            keys.insert(endKeys.begin(), endKeys.end());
        }
        return keys;
    }
};

TEST_F(WhereTraversalStepTest, testChildWithoutLabelsIsRejected) {
    auto child = TraversalBuilder::anonymous().out().build();
    EXPECT_THROW(WhereTraversalStep::create(Scope::GLOBAL, child), Exceptions::TraversalConstructionException);
}

TEST_F(WhereTraversalStepTest, testEndStepWithTwoLabelsIsRejected) {
    auto child = TraversalBuilder::anonymous().out().as("b").as("c").build();
    EXPECT_THROW(WhereTraversalStep::create(Scope::GLOBAL, child), Exceptions::TraversalConstructionException);
}

TEST_F(WhereTraversalStepTest, testStartLabelOnly) {
    auto child = TraversalBuilder::anonymous().as("a").out().build();
    auto whereStep = WhereTraversalStep::create(Scope::GLOBAL, child);

    EXPECT_EQ(whereStep->getScopeKeys(), std::set<std::string>{"a"});
    const auto& rewritten = whereStep->getWhereTraversal();
    ASSERT_EQ(rewritten->size(), 2U);
    ASSERT_INSTANCE_OF(rewritten->getStartStep(), WhereStartStep);
    EXPECT_EQ(rewritten->getStartStep()->as<WhereStartStep>()->getSelectKey(), std::optional<std::string>("a"));
    ASSERT_INSTANCE_OF(rewritten->getEndStep(), VertexStep);
    EXPECT_TRUE(rewritten->getStepsOfClass<WhereEndStep>().empty());
    EXPECT_TRUE(rewritten->getStepsOfClass<StartStep>().empty());

    // the argument is not modified
    ASSERT_INSTANCE_OF(child->getStartStep(), StartStep);
    EXPECT_EQ(child->getStartStep()->getLabels(), std::set<std::string>{"a"});
}

TEST_F(WhereTraversalStepTest, testEndLabelOnly) {
    auto whereStep = WhereTraversalStep::create(Scope::GLOBAL, TraversalBuilder::anonymous().out().as("b").build());

    EXPECT_EQ(whereStep->getScopeKeys(), std::set<std::string>{"b"});
    const auto& rewritten = whereStep->getWhereTraversal();
    ASSERT_EQ(rewritten->size(), 3U);
    ASSERT_INSTANCE_OF(rewritten->getStartStep(), WhereStartStep);
    EXPECT_FALSE(rewritten->getStartStep()->as<WhereStartStep>()->getSelectKey().has_value());
    EXPECT_FALSE(rewritten->getSteps()[1]->hasLabels());
    ASSERT_INSTANCE_OF(rewritten->getEndStep(), WhereEndStep);
    EXPECT_EQ(rewritten->getEndStep()->as<WhereEndStep>()->getMatchKey(), std::optional<std::string>("b"));
}

TEST_F(WhereTraversalStepTest, testLabelsInsideConnectives) {
    auto child = TraversalBuilder::anonymous()
                     .and_({TraversalBuilder::anonymous().as("a").out().build(),
                            TraversalBuilder::anonymous().as("a").in().as("b").build()})
                     .build();
    auto whereStep = WhereTraversalStep::create(Scope::GLOBAL, child);

    EXPECT_EQ(whereStep->getScopeKeys(), (std::set<std::string>{"a", "b"}));
    auto andStep = whereStep->getWhereTraversal()->getStartStep()->as<AndStep>();
    auto branches = andStep->getLocalChildren();
    ASSERT_EQ(branches.size(), 2U);
    ASSERT_INSTANCE_OF(branches[0]->getStartStep(), WhereStartStep);
    ASSERT_INSTANCE_OF(branches[1]->getStartStep(), WhereStartStep);
    ASSERT_INSTANCE_OF(branches[1]->getEndStep(), WhereEndStep);
}

TEST_F(WhereTraversalStepTest, testLabelRoundTrip) {
    auto whereStep = WhereTraversalStep::create(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().as("b").build());
    const auto& rewritten = whereStep->getWhereTraversal();

    EXPECT_EQ(markerKeys(rewritten), (std::set<std::string>{"a", "b"}));
    EXPECT_EQ(markerKeys(rewritten), whereStep->getScopeKeys());
    EXPECT_TRUE(TraversalHelper::getLabels(rewritten).empty());
}

TEST_F(WhereTraversalStepTest, testScopeOfEndMarkerIsFixed) {
    auto traversal = TraversalBuilder::anonymous()
                         .V()
                         .as("a")
                         .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().as("b").build())
                         .build();
    auto whereStep = traversal->getStepsOfClass<WhereTraversalStep>()[0];
    whereStep->setScope(Scope::LOCAL);

    EXPECT_EQ(whereStep->getScope(), Scope::LOCAL);
    auto startStep = whereStep->getWhereTraversal()->getStartStep()->as<WhereStartStep>();
    auto endStep = whereStep->getWhereTraversal()->getEndStep()->as<WhereEndStep>();
    EXPECT_EQ(startStep->getScope(), Scope::LOCAL);
    EXPECT_EQ(endStep->getScope(), Scope::GLOBAL);
    endStep->setScope(Scope::LOCAL);
    EXPECT_EQ(endStep->getScope(), Scope::GLOBAL);

    traversal->lock();
    EXPECT_THROW(whereStep->setScope(Scope::GLOBAL), Exceptions::TraversalConstructionException);
}

TEST_F(WhereTraversalStepTest, testScopeIsPartOfTheStartMarker) {
    auto globalStart = WhereStartStep::create("a", Scope::GLOBAL);
    auto localStart = WhereStartStep::create("a", Scope::LOCAL);
    EXPECT_EQ(globalStart->toString(), "WhereStartStep(GLOBAL,a)");
    EXPECT_EQ(WhereStartStep::create(std::nullopt, Scope::LOCAL)->toString(), "WhereStartStep(LOCAL)");
    EXPECT_FALSE(globalStart->equal(localStart));

    auto traversal = TraversalBuilder::anonymous()
                         .V()
                         .as("a")
                         .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().build())
                         .build();
    auto coerced = traversal->clone();
    coerced->getStepsOfClass<WhereTraversalStep>()[0]->setScope(Scope::LOCAL);
    auto original = traversal->getStepsOfClass<WhereTraversalStep>()[0]->getWhereTraversal();
    auto rewritten = coerced->getStepsOfClass<WhereTraversalStep>()[0]->getWhereTraversal();
    EXPECT_FALSE(original->getStartStep()->equal(rewritten->getStartStep()));
    EXPECT_FALSE(traversal->equal(coerced));
}

TEST_F(WhereTraversalStepTest, testScenarioVariableStart) {
    auto graph = Testing::TestGraph::createModern();
    auto traversal =
        TraversalBuilder::start(graph).V().as("a").where(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().build()).build();

    // only vertices with an outgoing edge pass
    EXPECT_EQ(traversal->toList(), (std::vector<Value>{Vertex{1}, Vertex{4}, Vertex{6}}));
}

TEST_F(WhereTraversalStepTest, testScenarioLabelledEnd) {
    auto graph = Testing::TestGraph::create(3);
    graph->addEdge(1, 1).addEdge(2, 3).addEdge(3, 1);
    auto traversal =
        TraversalBuilder::start(graph).V().as("b").where(Scope::GLOBAL, TraversalBuilder::anonymous().out().as("b").build()).build();

    // only the vertex with a self loop reaches its own binding of "b"
    EXPECT_EQ(traversal->toList(), std::vector<Value>{Vertex{1}});
}

TEST_F(WhereTraversalStepTest, testScenarioStartAndEnd) {
    auto graph = Testing::TestGraph::createModern();
    // pairs (a, b) with an edge a -> b
    auto traversal = TraversalBuilder::start(graph)
                         .V()
                         .as("a")
                         .out()
                         .as("b")
                         .V()
                         .where(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().as("b").build())
                         .count()
                         .build();
    // each of the 6 edges passes once for every vertex emitted by the second V()
    EXPECT_EQ(traversal->toList(), std::vector<Value>{Value(int64_t{36})});
}

TEST_F(WhereTraversalStepTest, testCloneCopiesTheRewrittenChild) {
    auto whereStep = WhereTraversalStep::create(Scope::GLOBAL, TraversalBuilder::anonymous().as("a").out().build());
    auto copy = whereStep->clone()->as<WhereTraversalStep>();

    EXPECT_TRUE(whereStep->equal(copy));
    EXPECT_NE(whereStep->getWhereTraversal(), copy->getWhereTraversal());
    EXPECT_EQ(copy->getScopeKeys(), whereStep->getScopeKeys());
    EXPECT_EQ(copy->getWhereTraversal()->getParent(), copy.get());
}

}// namespace GTC
