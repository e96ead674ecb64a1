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

#include <Exceptions/RuntimeException.hpp>
#include <GtcBaseTest.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/TestGraph.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace GTC {

class TraversalExecutionTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("TraversalExecutionTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup TraversalExecutionTest test class.");
    }

    void SetUp() override {
        Testing::BaseUnitTest::SetUp();
        graph = Testing::TestGraph::createModern();
    }

    static Value v(uint64_t id) { return Value(Vertex{id}); }

    static Value i(int64_t number) { return Value(number); }

    GraphPtr graph;
};

TEST_F(TraversalExecutionTest, testVerticesAndAdjacency) {
    EXPECT_EQ(TraversalBuilder::start(graph).V().build()->toList(), (std::vector<Value>{v(1), v(2), v(3), v(4), v(5), v(6)}));
    EXPECT_EQ(TraversalBuilder::start(graph).V().out().build()->toList(),
              (std::vector<Value>{v(2), v(4), v(3), v(3), v(5), v(3)}));
    EXPECT_EQ(TraversalBuilder::start(graph).V().out({"knows"}).build()->toList(), (std::vector<Value>{v(2), v(4)}));
    EXPECT_EQ(TraversalBuilder::start(graph).V().in().build()->toList(),
              (std::vector<Value>{v(1), v(1), v(4), v(6), v(1), v(4)}));
    EXPECT_EQ(TraversalBuilder::start(graph).V().both().count().build()->toList(), std::vector<Value>{i(12)});
}

TEST_F(TraversalExecutionTest, testDedupAndCount) {
    EXPECT_EQ(TraversalBuilder::start(graph).V().out().dedup().build()->toList(),
              (std::vector<Value>{v(2), v(4), v(3), v(5)}));
    EXPECT_EQ(TraversalBuilder::start(graph).V().out().count().build()->toList(), std::vector<Value>{i(6)});
    EXPECT_EQ(TraversalBuilder::start(graph).V().out().dedup().count().build()->toList(), std::vector<Value>{i(4)});
    EXPECT_EQ(TraversalBuilder::anonymous().inject({i(1), i(2), i(2), i(3)}).dedup().build()->toList(),
              (std::vector<Value>{i(1), i(2), i(3)}));
    EXPECT_EQ(TraversalBuilder::anonymous().inject({i(1), i(1)}).count().build()->toList(), std::vector<Value>{i(2)});
}

TEST_F(TraversalExecutionTest, testIsFilter) {
    EXPECT_EQ(TraversalBuilder::anonymous().inject({i(1), i(2), i(2), i(3)}).is(i(2)).build()->toList(),
              (std::vector<Value>{i(2), i(2)}));
    // values of different types are never equal
    EXPECT_TRUE(TraversalBuilder::anonymous().inject({Value(1.0)}).is(i(1)).build()->toList().empty());
}

TEST_F(TraversalExecutionTest, testLocalChildIsEvaluatedPerTraverser) {
    auto outDegree = TraversalBuilder::anonymous().out().count().build();
    EXPECT_EQ(TraversalBuilder::start(graph).V().local(outDegree).build()->toList(),
              (std::vector<Value>{i(3), i(0), i(0), i(2), i(0), i(1)}));
}

TEST_F(TraversalExecutionTest, testUnionConcatenatesBranches) {
    auto traversal = TraversalBuilder::start(graph)
                         .V()
                         .union_({TraversalBuilder::anonymous().out({"knows"}).build(),
                                  TraversalBuilder::anonymous().in({"knows"}).build()})
                         .build();
    EXPECT_EQ(traversal->toList(), (std::vector<Value>{v(2), v(4), v(1), v(1)}));
}

TEST_F(TraversalExecutionTest, testBooleanCombinators) {
    EXPECT_EQ(TraversalBuilder::start(graph).V().not_(TraversalBuilder::anonymous().out().build()).build()->toList(),
              (std::vector<Value>{v(2), v(3), v(5)}));
    EXPECT_EQ(TraversalBuilder::start(graph)
                  .V()
                  .and_({TraversalBuilder::anonymous().out().build(), TraversalBuilder::anonymous().in().build()})
                  .build()
                  ->toList(),
              std::vector<Value>{v(4)});
    EXPECT_EQ(TraversalBuilder::start(graph)
                  .V()
                  .or_({TraversalBuilder::anonymous().out({"created"}).build(),
                        TraversalBuilder::anonymous().in({"knows"}).build()})
                  .build()
                  ->toList(),
              (std::vector<Value>{v(1), v(2), v(4), v(6)}));
}

TEST_F(TraversalExecutionTest, testStoreFillsTheSideEffects) {
    auto traversal = TraversalBuilder::start(graph).V().out().store("x").count().build();
    EXPECT_EQ(traversal->toList(), std::vector<Value>{i(6)});
    ASSERT_TRUE(traversal->getSideEffects()->exists("x"));
    EXPECT_EQ(traversal->getSideEffects()->get("x").size(), 6U);
}

TEST_F(TraversalExecutionTest, testExecutionCompilesAndCanBeRepeated) {
    auto traversal = TraversalBuilder::start(graph).V().identity().out().dedup().build();
    EXPECT_FALSE(traversal->isLocked());
    auto firstRun = traversal->toList();
    EXPECT_TRUE(traversal->isLocked());
    // the identity step is removed by the default strategies
    EXPECT_EQ(traversal->size(), 3U);
    EXPECT_EQ(firstRun, traversal->toList());
}

TEST_F(TraversalExecutionTest, testGraphStepWithoutGraphFails) {
    auto traversal = TraversalBuilder::anonymous().V().build();
    EXPECT_THROW(traversal->toList(), Exceptions::RuntimeException);
}

}// namespace GTC
