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

#include <Exceptions/InvariantViolationException.hpp>
#include <Exceptions/TraversalConstructionException.hpp>
#include <GtcBaseTest.hpp>
#include <Optimizer/Strategies/ComputerVerificationStrategy.hpp>
#include <Optimizer/Strategies/DedupCountStrategy.hpp>
#include <Optimizer/Strategies/IdentityRemovalStrategy.hpp>
#include <Optimizer/Strategies/LocalScopeStrategy.hpp>
#include <Optimizer/Strategies/StandardVerificationStrategy.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Steps/Filter/IsStep.hpp>
#include <Traversal/Steps/Map/LocalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/TestGraph.hpp>
#include <functional>
#include <gtest/gtest.h>
#include <thread>

namespace GTC {

using namespace Optimizer;

/**
 * Strategy with configurable name, category and dependencies that records the traversals it is applied to.
 */
class TestStrategy : public TraversalStrategy {
  public:
    using Action = std::function<void(const TraversalPtr&)>;

    TestStrategy(std::string name,
                 StrategyCategory category,
                 std::set<std::string> prior = {},
                 std::set<std::string> post = {},
                 Action action = {})
        : name(std::move(name)), category(category), prior(std::move(prior)), post(std::move(post)), action(std::move(action)) {}

    void apply(const TraversalPtr& traversal) const override {
        if (action) {
            action(traversal);
        }
    }

    [[nodiscard]] std::string getName() const override { return name; }

    [[nodiscard]] StrategyCategory getCategory() const override { return category; }

    [[nodiscard]] std::set<std::string> applyPrior() const override { return prior; }

    [[nodiscard]] std::set<std::string> applyPost() const override { return post; }

  private:
    std::string name;
    StrategyCategory category;
    std::set<std::string> prior;
    std::set<std::string> post;
    Action action;
};

class TraversalStrategiesTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("TraversalStrategiesTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup TraversalStrategiesTest test class.");
    }

    static TraversalStrategyPtr strategy(const std::string& name,
                                         StrategyCategory category,
                                         std::set<std::string> prior = {},
                                         std::set<std::string> post = {},
                                         TestStrategy::Action action = {}) {
        return std::make_shared<TestStrategy>(name, category, std::move(prior), std::move(post), std::move(action));
    }

    static std::vector<std::string> names(const TraversalStrategiesPtr& strategies) {
        std::vector<std::string> result;
        for (const auto& current : strategies->getStrategies()) {
            result.push_back(current->getName());
        }
        return result;
    }
};

TEST_F(TraversalStrategiesTest, testDefaultStrategyOrder) {
    EXPECT_EQ(names(TraversalStrategies::getDefaultStrategies()),
              (std::vector<std::string>{"IdentityRemovalStrategy",
                                        "DedupCountStrategy",
                                        "LocalScopeStrategy",
                                        "ComputerVerificationStrategy",
                                        "StandardVerificationStrategy"}));
    EXPECT_TRUE(TraversalStrategies::getDefaultStrategies()->isVerifyingInvariants());
}

TEST_F(TraversalStrategiesTest, testCategoriesAreOrdered) {
    auto strategies = TraversalStrategies::create({strategy("V1", StrategyCategory::VERIFICATION),
                                                   strategy("F1", StrategyCategory::FINALIZATION),
                                                   strategy("O1", StrategyCategory::OPTIMIZATION),
                                                   strategy("P1", StrategyCategory::PROVIDER_OPTIMIZATION),
                                                   strategy("D1", StrategyCategory::DECORATION)});
    EXPECT_EQ(names(strategies), (std::vector<std::string>{"D1", "O1", "P1", "F1", "V1"}));
}

TEST_F(TraversalStrategiesTest, testDependenciesWithinCategory) {
    auto strategies = TraversalStrategies::create({strategy("A", StrategyCategory::OPTIMIZATION, {"B"}),
                                                   strategy("B", StrategyCategory::OPTIMIZATION),
                                                   strategy("C", StrategyCategory::OPTIMIZATION, {}, {"B"})});
    EXPECT_EQ(names(strategies), (std::vector<std::string>{"C", "B", "A"}));
}

TEST_F(TraversalStrategiesTest, testOrderDoesNotDependOnRegistration) {
    auto first = TraversalStrategies::create({strategy("X", StrategyCategory::OPTIMIZATION),
                                              strategy("Y", StrategyCategory::OPTIMIZATION, {"X"}),
                                              strategy("Z", StrategyCategory::OPTIMIZATION)});
    auto second = TraversalStrategies::create({strategy("Z", StrategyCategory::OPTIMIZATION),
                                               strategy("Y", StrategyCategory::OPTIMIZATION, {"X"}),
                                               strategy("X", StrategyCategory::OPTIMIZATION)});
    EXPECT_EQ(names(first), names(second));
    EXPECT_EQ(names(first), (std::vector<std::string>{"X", "Y", "Z"}));
}

TEST_F(TraversalStrategiesTest, testUnknownDependenciesAreIgnored) {
    auto strategies = TraversalStrategies::create({strategy("A", StrategyCategory::OPTIMIZATION, {"Missing"})});
    EXPECT_EQ(names(strategies), std::vector<std::string>{"A"});
}

TEST_F(TraversalStrategiesTest, testCyclicDependenciesAreRejected) {
    EXPECT_THROW(TraversalStrategies::create({strategy("A", StrategyCategory::OPTIMIZATION, {"B"}),
                                              strategy("B", StrategyCategory::OPTIMIZATION, {"A"})}),
                 Exceptions::TraversalConstructionException);
    EXPECT_THROW(TraversalStrategies::create({strategy("A", StrategyCategory::OPTIMIZATION, {}, {"A"})}),
                 Exceptions::TraversalConstructionException);
}

TEST_F(TraversalStrategiesTest, testDependenciesAcrossCategoriesAreRejected) {
    EXPECT_THROW(TraversalStrategies::create({strategy("A", StrategyCategory::OPTIMIZATION, {"V"}),
                                              strategy("V", StrategyCategory::VERIFICATION)}),
                 Exceptions::TraversalConstructionException);
}

TEST_F(TraversalStrategiesTest, testAddAndRemoveStrategies) {
    auto defaults = TraversalStrategies::getDefaultStrategies();
    auto extended = defaults->addStrategies({strategy("Decorate", StrategyCategory::DECORATION)});
    EXPECT_EQ(extended->getStrategies().size(), 6U);
    EXPECT_EQ(extended->getStrategies().front()->getName(), "Decorate");
    EXPECT_EQ(defaults->getStrategies().size(), 5U);

    // a strategy of the same name replaces the registered one
    auto replaced = extended->addStrategies({strategy("Decorate", StrategyCategory::FINALIZATION)});
    EXPECT_EQ(replaced->getStrategies().size(), 6U);
    EXPECT_EQ(replaced->getStrategies()[3]->getName(), "Decorate");
    EXPECT_EQ(replaced->getStrategies()[3]->getCategory(), StrategyCategory::FINALIZATION);

    auto reduced = replaced->removeStrategies({"Decorate", "LocalScopeStrategy"});
    EXPECT_EQ(names(reduced),
              (std::vector<std::string>{"IdentityRemovalStrategy",
                                        "DedupCountStrategy",
                                        "ComputerVerificationStrategy",
                                        "StandardVerificationStrategy"}));
}

TEST_F(TraversalStrategiesTest, testStrategiesVisitAllTraversalsInOrder) {
    std::vector<std::string> visits;
    auto record = [&visits](const std::string& name) {
        return [&visits, name](const TraversalPtr& traversal) {
            visits.push_back(name + ":" + std::to_string(traversal->size()));
        };
    };
    auto strategies = TraversalStrategies::create({strategy("Second", StrategyCategory::FINALIZATION, {}, {}, record("Second")),
                                                   strategy("First", StrategyCategory::DECORATION, {}, {}, record("First"))});
    auto traversal = TraversalBuilder::anonymous().V().local(TraversalBuilder::anonymous().out().count().build()).build();
    strategies->applyStrategies(traversal);

    EXPECT_EQ(visits, (std::vector<std::string>{"First:2", "First:2", "Second:2", "Second:2"}));
    EXPECT_TRUE(traversal->isLocked());

    // a locked traversal is not compiled again
    strategies->applyStrategies(traversal);
    EXPECT_EQ(visits.size(), 4U);
}

TEST_F(TraversalStrategiesTest, testBrokenInvariantsAreReported) {
    auto breakRequirements = [](const TraversalPtr& traversal) {
        if (traversal->isRoot()) {
            // bypasses the requirement cache of the traversal
            traversal->setSideEffects(SideEffects::create());
            traversal->getTraverserRequirements();
            traversal->getSideEffects()->add("x", Value(int64_t{1}));
        }
    };
    auto traversal = TraversalBuilder::anonymous().inject({Value(int64_t{1})}).build();
    auto verifying = TraversalStrategies::create({strategy("Break", StrategyCategory::OPTIMIZATION, {}, {}, breakRequirements)});
    EXPECT_THROW(verifying->applyStrategies(traversal), Exceptions::InvariantViolationException);

    auto other = TraversalBuilder::anonymous().inject({Value(int64_t{1})}).build();
    auto trusting =
        TraversalStrategies::create({strategy("Break", StrategyCategory::OPTIMIZATION, {}, {}, breakRequirements)}, false);
    EXPECT_NO_THROW(trusting->applyStrategies(other));
    EXPECT_TRUE(other->isLocked());
}

TEST_F(TraversalStrategiesTest, testIdempotenceOfTheOptimizations) {
    auto graph = Testing::TestGraph::createModern();
    auto traversal = TraversalBuilder::start(graph)
                         .withGraphComputer()
                         .V()
                         .identity()
                         .as("a")
                         .out()
                         .dedup()
                         .identity()
                         .count()
                         .build();
    auto optimizations = TraversalStrategies::create(
        {IdentityRemovalStrategy::instance(), DedupCountStrategy::instance(), LocalScopeStrategy::instance()});
    for (const auto& current : optimizations->getStrategies()) {
        current->apply(traversal);
    }
    auto once = traversal->toString();
    for (const auto& current : optimizations->getStrategies()) {
        current->apply(traversal);
    }
    EXPECT_EQ(once, traversal->toString());
    EXPECT_EQ(once, "[GraphStep(vertex)@[a], VertexStep(OUT), DedupCountGlobalStep]");
}

TEST_F(TraversalStrategiesTest, testConcurrentCompilationOfIndependentTraversals) {
    constexpr auto NUMBER_OF_THREADS = 8;
    auto graph = Testing::TestGraph::createModern();
    auto strategies = TraversalStrategies::getDefaultStrategies();
    std::vector<std::vector<Value>> results(NUMBER_OF_THREADS);
    std::vector<std::string> compiled(NUMBER_OF_THREADS);
    std::vector<std::thread> threads;
    for (auto i = 0; i < NUMBER_OF_THREADS; ++i) {
        threads.emplace_back([i, &graph, &strategies, &results, &compiled]() {
            auto traversal = TraversalBuilder::start(graph)
                                 .withGraphComputer(i % 2 == 0)
                                 .V()
                                 .identity()
                                 .out()
                                 .dedup()
                                 .count()
                                 .build();
            strategies->applyStrategies(traversal);
            compiled[i] = traversal->toString();
            results[i] = traversal->toList();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (auto i = 0; i < NUMBER_OF_THREADS; ++i) {
        EXPECT_EQ(results[i], std::vector<Value>{Value(int64_t{4})});
        if (i % 2 == 0) {
            EXPECT_EQ(compiled[i], "[GraphStep(vertex), VertexStep(OUT), DedupCountGlobalStep]");
        } else {
            EXPECT_EQ(compiled[i], "[GraphStep(vertex), VertexStep(OUT), DedupGlobalStep, CountGlobalStep]");
        }
    }
}

TEST_F(TraversalStrategiesTest, testToString) {
    auto strategies = TraversalStrategies::create({strategy("A", StrategyCategory::OPTIMIZATION)});
    EXPECT_EQ(strategies->toString(), "TraversalStrategies(A(OPTIMIZATION))");
}

}// namespace GTC
