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
#include <Optimizer/Phases/TraversalCompilationPhase.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Traversal.hpp>
#include <Util/Logger/Logger.hpp>
#include <utility>

namespace GTC::Optimizer {

TraversalCompilationPhasePtr TraversalCompilationPhase::create(const Configurations::CompilerConfiguration& configuration) {
    return std::shared_ptr<TraversalCompilationPhase>(
        new TraversalCompilationPhase(TraversalStrategies::create(configuration), configuration.graphComputer.getValue()));
}

TraversalCompilationPhase::TraversalCompilationPhase(TraversalStrategiesPtr strategies, bool graphComputer)
    : strategies(std::move(strategies)), graphComputer(graphComputer) {}

TraversalPtr TraversalCompilationPhase::execute(const TraversalPtr& traversal) {
    auto duplicateTraversal = traversal->clone();
    if (duplicateTraversal->isLocked()) {
        GTC_WARNING("TraversalCompilationPhase: " << traversal->toString() << " is already compiled");
        return duplicateTraversal;
    }
    if (graphComputer) {
        duplicateTraversal->setOnGraphComputer(true);
    }
    duplicateTraversal->setStrategies(strategies);
    strategies->applyStrategies(duplicateTraversal);
    GTC_DEBUG("TraversalCompilationPhase: compiled " << traversal->toString() << " into " << duplicateTraversal->toString());
    return duplicateTraversal;
}

const TraversalStrategiesPtr& TraversalCompilationPhase::getStrategies() const { return strategies; }

}// namespace GTC::Optimizer
