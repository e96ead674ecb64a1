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

#ifndef GTC_CORE_INCLUDE_OPTIMIZER_PHASES_TRAVERSALCOMPILATIONPHASE_HPP_
#define GTC_CORE_INCLUDE_OPTIMIZER_PHASES_TRAVERSALCOMPILATIONPHASE_HPP_

#include <Traversal/TraversalForwardRefs.hpp>
#include <memory>

namespace GTC::Configurations {
class CompilerConfiguration;
}// namespace GTC::Configurations

namespace GTC::Optimizer {

class TraversalCompilationPhase;
using TraversalCompilationPhasePtr = std::shared_ptr<TraversalCompilationPhase>;

/**
 * @brief This phase is responsible for compiling a traversal with the configured strategies
 */
class TraversalCompilationPhase {
  public:
    static TraversalCompilationPhasePtr create(const Configurations::CompilerConfiguration& configuration);

    /**
     * @brief Compiles a copy of the input traversal, the input is not modified
     * @param traversal : the input traversal
     * @return compiled and locked traversal
     */
    TraversalPtr execute(const TraversalPtr& traversal);

    [[nodiscard]] const TraversalStrategiesPtr& getStrategies() const;

  private:
    TraversalCompilationPhase(TraversalStrategiesPtr strategies, bool graphComputer);
    TraversalStrategiesPtr strategies;
    bool graphComputer;
};
}// namespace GTC::Optimizer
#endif// GTC_CORE_INCLUDE_OPTIMIZER_PHASES_TRAVERSALCOMPILATIONPHASE_HPP_
