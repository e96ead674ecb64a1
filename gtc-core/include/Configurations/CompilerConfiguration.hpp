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

#ifndef GTC_CORE_INCLUDE_CONFIGURATIONS_COMPILERCONFIGURATION_HPP_
#define GTC_CORE_INCLUDE_CONFIGURATIONS_COMPILERCONFIGURATION_HPP_

#include <Configurations/BaseConfiguration.hpp>
#include <Util/Logger/LogLevel.hpp>
#include <string>
#include <vector>

namespace GTC::Configurations {

const std::string LOG_LEVEL_CONFIG = "logLevel";
const std::string LOG_PATH_CONFIG = "logPath";
const std::string EXCLUDED_STRATEGIES_CONFIG = "excludedStrategies";
const std::string VERIFY_INVARIANTS_CONFIG = "verifyInvariantsAfterEachStrategy";
const std::string GRAPH_COMPUTER_CONFIG = "graphComputer";
const std::string CONFIG_PATH = "configPath";

/**
 * @brief ConfigOptions for the traversal compiler
 */
class CompilerConfiguration : public BaseConfiguration {
  public:
    CompilerConfiguration() : BaseConfiguration("CompilerConfiguration", "Options of the traversal compiler"){};
    CompilerConfiguration(std::string name, std::string description) : BaseConfiguration(name, description){};

    /**
     * @brief The log level (LOG_NONE, LOG_FATAL_ERROR, LOG_ERROR, LOG_WARNING, LOG_INFO, LOG_DEBUG, LOG_TRACE)
     */
    EnumOption<LogLevel> logLevel = {LOG_LEVEL_CONFIG,
                                     LogLevel::LOG_INFO,
                                     "The log level (LOG_NONE, LOG_WARNING, LOG_DEBUG, LOG_INFO, LOG_TRACE)"};

    StringOption logPath = {LOG_PATH_CONFIG, "gtc.log", "The log file"};

    /**
     * @brief Comma separated names of strategies that are removed from the default strategies,
     * e.g., "IdentityRemovalStrategy,LocalScopeStrategy".
     */
    StringOption excludedStrategies = {EXCLUDED_STRATEGIES_CONFIG, "", "Comma separated names of strategies to disable"};

    /**
     * @brief Checks the pipeline invariants after every strategy. Violations abort the compilation.
     */
    BoolOption verifyInvariantsAfterEachStrategy = {VERIFY_INVARIANTS_CONFIG,
                                                    true,
                                                    "Verify the pipeline invariants after each strategy. (Default: true)"};

    /**
     * @brief Compiles root traversals for the distributed graph computer.
     */
    BoolOption graphComputer = {GRAPH_COMPUTER_CONFIG,
                                false,
                                "Compile traversals for the distributed graph computer. (Default: false)"};

  private:
    std::vector<Configurations::BaseOption*> getOptions() override {
        return {&logLevel, &logPath, &excludedStrategies, &verifyInvariantsAfterEachStrategy, &graphComputer};
    }
};

}// namespace GTC::Configurations

#endif// GTC_CORE_INCLUDE_CONFIGURATIONS_COMPILERCONFIGURATION_HPP_
