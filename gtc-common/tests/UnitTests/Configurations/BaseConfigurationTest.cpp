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

#include <Configurations/BaseConfiguration.hpp>
#include <Configurations/ConfigurationException.hpp>
#include <GtcBaseTest.hpp>
#include <Util/Logger/Logger.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace GTC {

using namespace Configurations;

class TestConfiguration : public BaseConfiguration {
  public:
    TestConfiguration() : BaseConfiguration("TestConfiguration", "Configuration used by the tests"){};

    IntOption numberOfRetries = {"numberOfRetries", 3, "Number of retries"};
    BoolOption enabled = {"enabled", false, "Enables the feature"};
    StringOption name = {"name", "default", "Name of the feature"};
    EnumOption<LogLevel> level = {"level", LogLevel::LOG_INFO, "Level of the feature"};

  private:
    std::vector<BaseOption*> getOptions() override { return {&numberOfRetries, &enabled, &name, &level}; }
};

class BaseConfigurationTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        GTC::Logger::setupLogging("BaseConfigurationTest.log", GTC::LogLevel::LOG_DEBUG);
        GTC_INFO("Setup BaseConfigurationTest test class.");
    }

    void TearDown() override {
        for (const auto& file : writtenFiles) {
            std::filesystem::remove(file);
        }
        Testing::BaseUnitTest::TearDown();
    }

    std::string writeYAML(const std::string& fileName, const std::string& content) {
        auto path = (std::filesystem::temp_directory_path() / fileName).string();
        std::ofstream out(path, std::ofstream::trunc);
        out << content;
        out.close();
        writtenFiles.push_back(path);
        return path;
    }

  private:
    std::vector<std::string> writtenFiles;
};

TEST_F(BaseConfigurationTest, testDefaultValues) {
    TestConfiguration configuration;
    EXPECT_EQ(configuration.numberOfRetries.getValue(), 3);
    EXPECT_FALSE(configuration.enabled.getValue());
    EXPECT_EQ(configuration.name.getValue(), "default");
    EXPECT_EQ(configuration.level.getValue(), LogLevel::LOG_INFO);
}

TEST_F(BaseConfigurationTest, testOverwriteWithYAMLFile) {
    TestConfiguration configuration;
    auto path = writeYAML("gtcBaseConfigurationTest.yaml", "numberOfRetries: 7\nenabled: true\nlevel: LOG_TRACE\nname:\n");
    configuration.overwriteConfigWithYAMLFileInput(path);

    EXPECT_EQ(configuration.numberOfRetries.getValue(), 7);
    EXPECT_TRUE(configuration.enabled.getValue());
    EXPECT_EQ(configuration.level.getValue(), LogLevel::LOG_TRACE);
    // empty entries keep the current value
    EXPECT_EQ(configuration.name.getValue(), "default");
}

TEST_F(BaseConfigurationTest, testInvalidYAMLValues) {
    TestConfiguration configuration;
    auto wrongType = writeYAML("gtcWrongTypeTest.yaml", "numberOfRetries: many\n");
    EXPECT_THROW(configuration.overwriteConfigWithYAMLFileInput(wrongType), ConfigurationException);

    auto wrongEnum = writeYAML("gtcWrongEnumTest.yaml", "level: LOG_EVERYTHING\n");
    EXPECT_THROW(configuration.overwriteConfigWithYAMLFileInput(wrongEnum), ConfigurationException);

    auto unknownOption = writeYAML("gtcUnknownOptionTest.yaml", "color: blue\n");
    EXPECT_THROW(configuration.overwriteConfigWithYAMLFileInput(unknownOption), ConfigurationException);

    EXPECT_THROW(configuration.overwriteConfigWithYAMLFileInput(""), ConfigurationException);
}

TEST_F(BaseConfigurationTest, testOverwriteWithCommandLine) {
    TestConfiguration configuration;
    configuration.overwriteConfigWithCommandLineInput({{"--numberOfRetries", "11"}, {"--name", "cli"}, {"--level", "LOG_ERROR"}});

    EXPECT_EQ(configuration.numberOfRetries.getValue(), 11);
    EXPECT_EQ(configuration.name.getValue(), "cli");
    EXPECT_EQ(configuration.level.getValue(), LogLevel::LOG_ERROR);
    EXPECT_FALSE(configuration.enabled.getValue());

    EXPECT_THROW(configuration.overwriteConfigWithCommandLineInput({{"--color", "blue"}}), ConfigurationException);
    EXPECT_THROW(configuration.overwriteConfigWithCommandLineInput({{"--enabled", "maybe"}}), ConfigurationException);
}

TEST_F(BaseConfigurationTest, testClearRestoresDefaults) {
    TestConfiguration configuration;
    configuration.numberOfRetries = 42;
    configuration.level = LogLevel::LOG_NONE;
    configuration.clear();

    EXPECT_EQ(configuration.numberOfRetries.getValue(), configuration.numberOfRetries.getDefaultValue());
    EXPECT_EQ(configuration.level.getValue(), configuration.level.getDefaultValue());
}

TEST_F(BaseConfigurationTest, testToStringListsAllOptions) {
    TestConfiguration configuration;
    auto description = configuration.toString();
    EXPECT_NE(description.find("TestConfiguration"), std::string::npos);
    EXPECT_NE(description.find("numberOfRetries"), std::string::npos);
    EXPECT_NE(description.find("level: LOG_INFO"), std::string::npos);
}

}// namespace GTC
