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

#include <Exceptions/VerificationException.hpp>
#include <Optimizer/Strategies/ComputerVerificationStrategy.hpp>
#include <Traversal/Steps/Map/VertexStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Util/TraversalHelper.hpp>

namespace GTC::Optimizer {

ComputerVerificationStrategyPtr ComputerVerificationStrategy::instance() {
    static const ComputerVerificationStrategyPtr strategy(new ComputerVerificationStrategy());
    return strategy;
}

void ComputerVerificationStrategy::apply(const TraversalPtr& traversal) const {
    if (!TraversalHelper::onGraphComputer(*traversal) || !TraversalHelper::isLocalChild(*traversal)) {
        return;
    }
    if (traversal->getStepsOfClass<VertexStep>().size() > 1) {
        throw Exceptions::VerificationException("Local traversals may not traverse past the adjacent vertices on the graph computer: "
                                                + traversal->toString());
    }
}

std::string ComputerVerificationStrategy::getName() const { return "ComputerVerificationStrategy"; }

StrategyCategory ComputerVerificationStrategy::getCategory() const { return StrategyCategory::VERIFICATION; }

}// namespace GTC::Optimizer
