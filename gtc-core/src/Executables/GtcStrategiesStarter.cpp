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

#include <Configurations/CompilerConfiguration.hpp>
#include <Optimizer/Phases/TraversalCompilationPhase.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Util/Logger/Logger.hpp>
#include <iostream>
#include <map>
#include <string>

const std::string logo = "/********************************************************\n"
                         " *      ___   _____   ___\n"
                         " *     / __| |_   _| / __|\n"
                         " *    | (_ |   | |  | (__      Traversal Strategies\n"
                         " *     \\___|   |_|   \\___|\n"
                         " *\n"
                         " ********************************************************/";

/**
 * Prints the ordered strategy set of a compiler configuration and compiles a sample traversal with it.
 * Options are read from --configPath=<yaml> and overwritten by --<option>=<value> parameters.
 */
int main(int argc, const char* argv[]) {
    std::cout << logo << std::endl;

    GTC::Configurations::CompilerConfiguration configuration;
    try {
        std::map<std::string, std::string> commandLineParams;
        std::string configPath;
        for (int i = 1; i < argc; ++i) {
            auto argument = std::string(argv[i]);
            auto separator = argument.find('=');
            if (argument.rfind("--", 0) != 0 || separator == std::string::npos) {
                std::cerr << "Error: parameters have to be of the form --name=value, found " << argument << std::endl;
                return -1;
            }
            auto name = argument.substr(0, separator);
            auto value = argument.substr(separator + 1);
            if (name == "--" + GTC::Configurations::CONFIG_PATH) {
                configPath = value;
            } else {
                commandLineParams[name] = value;
            }
        }
        if (!configPath.empty()) {
            configuration.overwriteConfigWithYAMLFileInput(configPath);
        }
        configuration.overwriteConfigWithCommandLineInput(commandLineParams);
    } catch (std::exception& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
        return -1;
    }

    GTC::Logger::setupLogging(configuration.logPath.getValue(), configuration.logLevel.getValue());
    GTC_INFO("GtcStrategiesStarter: " << configuration.toString());

    try {
        auto phase = GTC::Optimizer::TraversalCompilationPhase::create(configuration);
        std::cout << phase->getStrategies()->toString() << std::endl;

        auto sample = GTC::TraversalBuilder::anonymous()
                          .inject({GTC::Value(int64_t{1}), GTC::Value(int64_t{2}), GTC::Value(int64_t{2})})
                          .identity()
                          .dedup()
                          .count()
                          .build();
        auto compiled = phase->execute(sample);
        std::cout << sample->toString() << " => " << compiled->toString() << std::endl;
        for (const auto& value : compiled->toList()) {
            std::cout << GTC::toString(value) << std::endl;
        }
    } catch (std::exception& e) {
        GTC_ERROR("GtcStrategiesStarter: " << e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }
    return 0;
}
