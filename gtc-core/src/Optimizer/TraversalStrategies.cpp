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

#include <Configurations/CompilerConfiguration.hpp>
#include <Configurations/ConfigurationException.hpp>
#include <Exceptions/TraversalConstructionException.hpp>
#include <Optimizer/Strategies/ComputerVerificationStrategy.hpp>
#include <Optimizer/Strategies/DedupCountStrategy.hpp>
#include <Optimizer/Strategies/IdentityRemovalStrategy.hpp>
#include <Optimizer/Strategies/LocalScopeStrategy.hpp>
#include <Optimizer/Strategies/StandardVerificationStrategy.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Steps/TraversalParent.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalHelper.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/UtilityFunctions.hpp>
#include <algorithm>
#include <deque>
#include <iterator>
#include <magic_enum.hpp>
#include <map>
#include <sstream>
#include <utility>

namespace GTC::Optimizer {

TraversalStrategies::TraversalStrategies(std::vector<TraversalStrategyPtr> strategies, bool verifyInvariants)
    : strategies(std::move(strategies)), verifyInvariants(verifyInvariants) {}

TraversalStrategiesPtr TraversalStrategies::create(const std::vector<TraversalStrategyPtr>& strategies, bool verifyInvariants) {
    return std::shared_ptr<TraversalStrategies>(new TraversalStrategies(sortStrategies(strategies), verifyInvariants));
}

TraversalStrategiesPtr TraversalStrategies::create(const Configurations::CompilerConfiguration& configuration) {
    auto excluded = Util::splitWithStringDelimiter(configuration.excludedStrategies.getValue(), ",");
    std::vector<TraversalStrategyPtr> selected = getDefaultStrategyList();
    for (const auto& name : excluded) {
        auto found = std::find_if(selected.begin(), selected.end(), [&name](const TraversalStrategyPtr& strategy) {
            return strategy->getName() == name;
        });
        if (found == selected.end()) {
            throw Configurations::ConfigurationException("Unknown strategy " + name + " in "
                                                         + Configurations::EXCLUDED_STRATEGIES_CONFIG);
        }
        selected.erase(found);
    }
    GTC_DEBUG("TraversalStrategies: excluded " << excluded.size() << " default strategies");
    return create(selected, configuration.verifyInvariantsAfterEachStrategy.getValue());
}

std::vector<TraversalStrategyPtr> TraversalStrategies::getDefaultStrategyList() {
    return {IdentityRemovalStrategy::instance(),
            DedupCountStrategy::instance(),
            LocalScopeStrategy::instance(),
            ComputerVerificationStrategy::instance(),
            StandardVerificationStrategy::instance()};
}

TraversalStrategiesPtr TraversalStrategies::getDefaultStrategies() {
    static const TraversalStrategiesPtr defaultStrategies = create(getDefaultStrategyList());
    return defaultStrategies;
}

TraversalStrategiesPtr TraversalStrategies::addStrategies(const std::vector<TraversalStrategyPtr>& strategiesToAdd) const {
    auto merged = strategies;
    merged.insert(merged.end(), strategiesToAdd.begin(), strategiesToAdd.end());
    return create(merged, verifyInvariants);
}

TraversalStrategiesPtr TraversalStrategies::removeStrategies(const std::set<std::string>& names) const {
    std::vector<TraversalStrategyPtr> remaining;
    std::copy_if(strategies.begin(), strategies.end(), std::back_inserter(remaining), [&names](const TraversalStrategyPtr& strategy) {
        return !names.contains(strategy->getName());
    });
    return create(remaining, verifyInvariants);
}

const std::vector<TraversalStrategyPtr>& TraversalStrategies::getStrategies() const { return strategies; }

bool TraversalStrategies::isVerifyingInvariants() const { return verifyInvariants; }

std::vector<TraversalStrategyPtr> TraversalStrategies::sortStrategies(const std::vector<TraversalStrategyPtr>& strategies) {
    // 1. Deduplicate by name, the last registration wins
    std::map<std::string, TraversalStrategyPtr> byName;
    for (const auto& strategy : strategies) {
        if (!strategy) {
            throw Exceptions::TraversalConstructionException("Cannot register an empty strategy");
        }
        byName[strategy->getName()] = strategy;
    }

    // 2. Dependencies may only point to strategies of the same category
    for (const auto& [name, strategy] : byName) {
        std::set<std::string> dependencies = strategy->applyPrior();
        auto post = strategy->applyPost();
        dependencies.insert(post.begin(), post.end());
        for (const auto& dependency : dependencies) {
            auto found = byName.find(dependency);
            if (found != byName.end() && found->second->getCategory() != strategy->getCategory()) {
                throw Exceptions::TraversalConstructionException("The strategy " + strategy->toString()
                                                                 + " cannot depend on " + found->second->toString()
                                                                 + " of another category");
            }
        }
    }

    // 3. Topological sort per category, ready strategies are taken in name order
    std::vector<TraversalStrategyPtr> sorted;
    for (auto category : magic_enum::enum_values<StrategyCategory>()) {
        std::map<std::string, std::set<std::string>> successors;
        std::map<std::string, size_t> inDegree;
        for (const auto& [name, strategy] : byName) {
            if (strategy->getCategory() == category) {
                successors[name];
                inDegree[name];
            }
        }
        auto addEdge = [&](const std::string& from, const std::string& to) {
            if (inDegree.contains(from) && inDegree.contains(to) && successors[from].insert(to).second) {
                inDegree[to]++;
            }
        };
        for (const auto& [name, ignored] : inDegree) {
            const auto& strategy = byName.at(name);
            for (const auto& prior : strategy->applyPrior()) {
                addEdge(prior, name);
            }
            for (const auto& post : strategy->applyPost()) {
                addEdge(name, post);
            }
        }

        std::set<std::string> ready;
        for (const auto& [name, degree] : inDegree) {
            if (degree == 0) {
                ready.insert(name);
            }
        }
        size_t emitted = 0;
        while (!ready.empty()) {
            auto name = *ready.begin();
            ready.erase(ready.begin());
            sorted.push_back(byName.at(name));
            emitted++;
            for (const auto& successor : successors[name]) {
                if (--inDegree[successor] == 0) {
                    ready.insert(successor);
                }
            }
        }
        if (emitted != inDegree.size()) {
            std::stringstream cycle;
            for (const auto& [name, degree] : inDegree) {
                if (degree > 0) {
                    cycle << name << " ";
                }
            }
            throw Exceptions::TraversalConstructionException("The strategies of category "
                                                             + std::string(magic_enum::enum_name(category))
                                                             + " have cyclic dependencies: " + cycle.str());
        }
    }
    return sorted;
}

void TraversalStrategies::applyStrategies(const TraversalPtr& traversal) const {
    if (traversal->isLocked()) {
        GTC_DEBUG("TraversalStrategies: " << traversal->toString() << " is locked, skipping");
        return;
    }
    GTC_INFO("TraversalStrategies: applying " << strategies.size() << " strategies to " << traversal->toString());
    for (const auto& strategy : strategies) {
        // children created by a strategy are visited by the same strategy
        std::deque<TraversalPtr> worklist{traversal};
        while (!worklist.empty()) {
            auto current = worklist.front();
            worklist.pop_front();
            strategy->apply(current);
            for (const auto& step : current->getSteps()) {
                if (auto* parent = dynamic_cast<TraversalParent*>(step.get())) {
                    for (const auto& child : parent->getChildren()) {
                        worklist.push_back(child);
                    }
                }
            }
        }
        traversal->getTraverserRequirements();
        GTC_DEBUG("TraversalStrategies: after " << strategy->getName() << ": " << traversal->toString());
        if (verifyInvariants) {
            TraversalHelper::verifyInvariants(traversal);
        }
    }
    traversal->lock();
}

std::string TraversalStrategies::toString() const {
    std::stringstream ss;
    ss << "TraversalStrategies(";
    for (size_t i = 0; i < strategies.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << strategies[i]->toString();
    }
    ss << ")";
    return ss.str();
}

}// namespace GTC::Optimizer
