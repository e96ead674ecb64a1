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

#ifndef GTC_CORE_INCLUDE_EXCEPTIONS_TRAVERSALCONSTRUCTIONEXCEPTION_HPP_
#define GTC_CORE_INCLUDE_EXCEPTIONS_TRAVERSALCONSTRUCTIONEXCEPTION_HPP_

#include <Exceptions/RuntimeException.hpp>
#include <string>

namespace GTC::Exceptions {

/**
 * @brief Raised when a traversal cannot be assembled, e.g., a where()-traversal without labels,
 * a strategy ordering cycle or a mutation of a locked traversal. Nothing built by the failed operation stays reachable.
 */
class TraversalConstructionException : public RuntimeException {
  public:
    explicit TraversalConstructionException(const std::string& message,
                                            const std::source_location location = std::source_location::current());
};

}// namespace GTC::Exceptions

#endif// GTC_CORE_INCLUDE_EXCEPTIONS_TRAVERSALCONSTRUCTIONEXCEPTION_HPP_
