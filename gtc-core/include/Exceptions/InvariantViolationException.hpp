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

#ifndef GTC_CORE_INCLUDE_EXCEPTIONS_INVARIANTVIOLATIONEXCEPTION_HPP_
#define GTC_CORE_INCLUDE_EXCEPTIONS_INVARIANTVIOLATIONEXCEPTION_HPP_

#include <Exceptions/RuntimeException.hpp>
#include <string>

namespace GTC::Exceptions {

/**
 * @brief Raised when a rewrite leaves a traversal mislinked, non-contiguous or with a stale requirement set.
 * It always indicates a bug in a strategy.
 */
class InvariantViolationException : public RuntimeException {
  public:
    explicit InvariantViolationException(const std::string& message,
                                         const std::source_location location = std::source_location::current());
};

}// namespace GTC::Exceptions

#endif// GTC_CORE_INCLUDE_EXCEPTIONS_INVARIANTVIOLATIONEXCEPTION_HPP_
