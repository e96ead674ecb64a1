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

#ifndef GTC_CORE_INCLUDE_UTIL_UTILITYFUNCTIONS_HPP_
#define GTC_CORE_INCLUDE_UTIL_UTILITYFUNCTIONS_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace GTC {

using StepId = uint64_t;
static constexpr StepId INVALID_STEP_ID = 0;

namespace Util {

/**
 * @brief Returns the next free step id. Step ids are unique within the process.
 * @return step id
 */
StepId getNextStepId();

/**
 * @brief splits a string given a delimiter into multiple substrings stored in a vector
 * the delimiter is allowed to be a string rather than a char only.
 * @param data - the string that is to be split
 * @param delimiter - the string that is to be split upon e.g. / or -
 * @return vector of non-empty, trimmed substrings
 */
std::vector<std::string> splitWithStringDelimiter(const std::string& data, const std::string& delimiter);

/**
 * @brief removes leading and trailing whitespaces
 */
std::string trim(std::string str);

}// namespace Util
}// namespace GTC

#endif// GTC_CORE_INCLUDE_UTIL_UTILITYFUNCTIONS_HPP_
