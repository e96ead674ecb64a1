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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_UTIL_TRAVERSALUTIL_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_UTIL_TRAVERSALUTIL_HPP_

#include <Traversal/TraversalForwardRefs.hpp>
#include <vector>

namespace GTC::TraversalUtil {

/**
 * @brief Runs a copy of the traverser through the child traversal.
 * @return true if the child produced at least one traverser
 */
bool test(const TraverserPtr& traverser, const TraversalPtr& child);

/**
 * @brief Runs a copy of the traverser through the child traversal and returns everything the child produced.
 */
std::vector<TraverserPtr> apply(const TraverserPtr& traverser, const TraversalPtr& child);

}// namespace GTC::TraversalUtil

#endif// GTC_CORE_INCLUDE_TRAVERSAL_UTIL_TRAVERSALUTIL_HPP_
