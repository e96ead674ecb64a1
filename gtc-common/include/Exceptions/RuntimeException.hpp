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

#ifndef GTC_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_
#define GTC_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_

#include <exception>
#include <source_location>
#include <string>

namespace GTC::Exceptions {

/**
 * @brief Base of all GTC errors. The message is logged together with the throw site when the exception is created.
 */
class RuntimeException : public std::exception {
  public:
    explicit RuntimeException(std::string msg, std::source_location location = std::source_location::current());

    [[nodiscard]] const char* what() const noexcept override;

    /**
     * @brief Returns the source location the exception was created at.
     */
    [[nodiscard]] const std::source_location& where() const noexcept;

  protected:
    std::string errorMessage;
    std::source_location location;
};

}// namespace GTC::Exceptions

#endif// GTC_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_
