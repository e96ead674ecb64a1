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
#include <Configurations/ConfigurationException.hpp>
#include <GtcBaseTest.hpp>
#include <Optimizer/Phases/TraversalCompilationPhase.hpp>
#include <Optimizer/TraversalStrategies.hpp>
#include <Traversal/Steps/Map/DedupCountGlobalStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/TraversalBuilder.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/TestGraph.hpp>
#include <gtest/gtest.h>
#include <map>
#include <string>

namespace GTC {

using namespace Configurations;

class CompilerConfigurationTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("CompilerConfigurationTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup CompilerConfigurationTest test class.");
    }

    static std::map<std::string, std::string> makeCommandLineArgs(const std::vector<std::string>& args) {
        std::map<std::string, std::string> result;
        for (const auto& arg : args) {
            auto pos = arg.find('=');
            result.insert({arg.substr(0, pos), arg.substr(pos + 1)});
        }
        return result;
    }
};

TEST_F(CompilerConfigurationTest, testDefaults) {
    CompilerConfiguration configuration;
    EXPECT_EQ(configuration.logLevel.getValue(), LogLevel::LOG_INFO);
    EXPECT_EQ(configuration.logPath.getValue(), "gtc.log");
    EXPECT_EQ(configuration.excludedStrategies.getValue(), "");
    EXPECT_TRUE(configuration.verifyInvariantsAfterEachStrategy.getValue());
    EXPECT_FALSE(configuration.graphComputer.getValue());

    auto strategies = Optimizer::TraversalStrategies::create(configuration);
    EXPECT_EQ(strategies->getStrategies().size(),
              Optimizer::TraversalStrategies::getDefaultStrategies()->getStrategies().size());
}

TEST_F(CompilerConfigurationTest, testEmptyYAMLFileKeepsDefaults) {
    CompilerConfiguration configuration;
    configuration.overwriteConfigWithYAMLFileInput(std::string(TEST_DATA_DIRECTORY) + "emptyCompilerConfiguration.yaml");
    EXPECT_EQ(configuration.logLevel.getValue(), configuration.logLevel.getDefaultValue());
    EXPECT_EQ(configuration.logPath.getValue(), configuration.logPath.getDefaultValue());
    EXPECT_EQ(configuration.excludedStrategies.getValue(), configuration.excludedStrategies.getDefaultValue());
    EXPECT_EQ(configuration.verifyInvariantsAfterEachStrategy.getValue(),
              configuration.verifyInvariantsAfterEachStrategy.getDefaultValue());
    EXPECT_EQ(configuration.graphComputer.getValue(), configuration.graphComputer.getDefaultValue());
}

TEST_F(CompilerConfigurationTest, testYAMLFile) {
    CompilerConfiguration configuration;
    configuration.overwriteConfigWithYAMLFileInput(std::string(TEST_DATA_DIRECTORY) + "compilerConfiguration.yaml");
    EXPECT_EQ(configuration.logLevel.getValue(), LogLevel::LOG_DEBUG);
    EXPECT_EQ(configuration.logPath.getValue(), "compiler.log");
    EXPECT_FALSE(configuration.verifyInvariantsAfterEachStrategy.getValue());
    EXPECT_TRUE(configuration.graphComputer.getValue());

    auto strategies = Optimizer::TraversalStrategies::create(configuration);
    EXPECT_FALSE(strategies->isVerifyingInvariants());
    std::vector<std::string> names;
    for (const auto& strategy : strategies->getStrategies()) {
        names.push_back(strategy->getName());
    }
    EXPECT_EQ(names,
              (std::vector<std::string>{"IdentityRemovalStrategy", "ComputerVerificationStrategy", "StandardVerificationStrategy"}));
}

TEST_F(CompilerConfigurationTest, testInvalidYAMLFiles) {
    CompilerConfiguration configuration;
    EXPECT_THROW(configuration.overwriteConfigWithYAMLFileInput(std::string(TEST_DATA_DIRECTORY) + "missing.yaml"),
                 ConfigurationException);
    EXPECT_THROW(
        configuration.overwriteConfigWithYAMLFileInput(std::string(TEST_DATA_DIRECTORY) + "unknownOptionCompilerConfiguration.yaml"),
        ConfigurationException);
}

TEST_F(CompilerConfigurationTest, testCommandLineOverwritesYAMLFile) {
    CompilerConfiguration configuration;
    configuration.overwriteConfigWithYAMLFileInput(std::string(TEST_DATA_DIRECTORY) + "compilerConfiguration.yaml");
    configuration.overwriteConfigWithCommandLineInput(makeCommandLineArgs({"--" + LOG_LEVEL_CONFIG + "=LOG_WARNING",
                                                                           "--" + EXCLUDED_STRATEGIES_CONFIG + "=",
                                                                           "--" + GRAPH_COMPUTER_CONFIG + "=false"}));
    EXPECT_EQ(configuration.logLevel.getValue(), LogLevel::LOG_WARNING);
    EXPECT_EQ(configuration.logPath.getValue(), "compiler.log");
    EXPECT_EQ(configuration.excludedStrategies.getValue(), "");
    EXPECT_FALSE(configuration.graphComputer.getValue());
}

TEST_F(CompilerConfigurationTest, testInvalidCommandLineParameters) {
    CompilerConfiguration configuration;
    EXPECT_THROW(configuration.overwriteConfigWithCommandLineInput(makeCommandLineArgs({"--unknownOption=1"})),
                 ConfigurationException);
    EXPECT_THROW(configuration.overwriteConfigWithCommandLineInput(makeCommandLineArgs({"--" + LOG_LEVEL_CONFIG + "=LOUD"})),
                 ConfigurationException);
}

TEST_F(CompilerConfigurationTest, testUnknownExcludedStrategy) {
    CompilerConfiguration configuration;
    configuration.excludedStrategies = "IdentityRemovalStrategy,NoSuchStrategy";
    EXPECT_THROW(Optimizer::TraversalStrategies::create(configuration), ConfigurationException);
}

TEST_F(CompilerConfigurationTest, testCompilationPhaseUsesTheConfiguration) {
    CompilerConfiguration configuration;
    configuration.graphComputer = true;
    auto phase = Optimizer::TraversalCompilationPhase::create(configuration);

    auto traversal = TraversalBuilder::start(Testing::TestGraph::createModern()).V().out().dedup().count().build();
    auto compiled = phase->execute(traversal);

    EXPECT_FALSE(traversal->isLocked());
    EXPECT_EQ(traversal->size(), 4U);
    EXPECT_TRUE(compiled->isLocked());
    EXPECT_TRUE(compiled->isOnGraphComputer());
    EXPECT_EQ(compiled->getStrategies(), phase->getStrategies());
    ASSERT_INSTANCE_OF(compiled->getEndStep(), DedupCountGlobalStep);
    EXPECT_EQ(compiled->toList(), std::vector<Value>{Value(int64_t{4})});
}

}// namespace GTC
