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

#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>
#include <Traversal/Util/TraversalUtil.hpp>

namespace GTC::TraversalUtil {

bool test(const TraverserPtr& traverser, const TraversalPtr& child) { return !apply(traverser, child).empty(); }

std::vector<TraverserPtr> apply(const TraverserPtr& traverser, const TraversalPtr& child) {
    child->reset();
    return child->processTraversers({traverser->split()});
}

}// namespace GTC::TraversalUtil
