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
#ifndef GTC_TESTS_UTIL_GTCBASETEST_HPP_
#define GTC_TESTS_UTIL_GTCBASETEST_HPP_

#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>
#include <string>

/// Fails the current test unless the step is an instance of the given class.
#define ASSERT_INSTANCE_OF(step, type) ASSERT_TRUE((step)->instanceOf<type>()) << (step)->toString() << " is not a " #type

namespace GTC::Testing {

/**
 * @brief Base class of all unit tests. It brackets every test with log messages and flushes the logger when the test ends,
 * so the log file of a failing test is complete.
 */
class BaseUnitTest : public testing::Test {
  public:
    void SetUp() override;

    void TearDown() override;

  protected:
    /**
     * @brief Returns the name of the currently running test as "Suite.Test"
     */
    static std::string currentTestName();
};

}// namespace GTC::Testing

#endif// GTC_TESTS_UTIL_GTCBASETEST_HPP_
