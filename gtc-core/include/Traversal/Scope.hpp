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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_SCOPE_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_SCOPE_HPP_

#include <cstdint>

namespace GTC {

/**
 * @brief LOCAL scope only looks at the current value (and the side effects) of a traverser,
 * GLOBAL scope looks at the full path history.
 */
enum class Scope : uint8_t { LOCAL, GLOBAL };

/**
 * @brief Selects among multiple bindings of the same label in a path.
 */
enum class Pop : uint8_t { FIRST, LAST };

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_SCOPE_HPP_
