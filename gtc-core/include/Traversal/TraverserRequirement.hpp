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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSERREQUIREMENT_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSERREQUIREMENT_HPP_

#include <cstdint>
#include <set>
#include <string>

namespace GTC {

/**
 * @brief The fields a traverser has to carry so that every step of a traversal can be evaluated.
 */
enum class TraverserRequirement : uint8_t {
    // the traverser counts how many equal traversers it represents
    BULK,
    // the traverser carries its current value
    OBJECT,
    // the traverser retains the value of every step it passed
    PATH,
    // the traverser retains only the values of labelled steps
    LABELED_PATH,
    // the traverser has access to the side-effect bag of its traversal
    SIDE_EFFECTS
};

using TraverserRequirements = std::set<TraverserRequirement>;

std::string toString(const TraverserRequirements& requirements);

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSERREQUIREMENT_HPP_
