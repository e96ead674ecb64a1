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

#include <Optimizer/TraversalStrategy.hpp>
#include <magic_enum.hpp>

namespace GTC::Optimizer {

std::set<std::string> TraversalStrategy::applyPrior() const { return {}; }

std::set<std::string> TraversalStrategy::applyPost() const { return {}; }

std::string TraversalStrategy::toString() const {
    return getName() + "(" + std::string(magic_enum::enum_name(getCategory())) + ")";
}

}// namespace GTC::Optimizer
