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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSALFORWARDREFS_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSALFORWARDREFS_HPP_

#include <memory>

namespace GTC {

class Traversal;
using TraversalPtr = std::shared_ptr<Traversal>;

class Traverser;
using TraverserPtr = std::shared_ptr<Traverser>;

class TraversalParent;

class Step;
using StepPtr = std::shared_ptr<Step>;

namespace Optimizer {
class TraversalStrategies;
class TraversalStrategy;
}// namespace Optimizer

using TraversalStrategiesPtr = std::shared_ptr<const Optimizer::TraversalStrategies>;
using TraversalStrategyPtr = std::shared_ptr<const Optimizer::TraversalStrategy>;

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSALFORWARDREFS_HPP_
