//
// Created by gregorian-rayne on 1/11/26.
//

#include "sasa/config/config.hpp"
#include "sasa/utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace sasa::config
{
    namespace fs = std::filesystem;

    TEST(ConfigTest, Defaults) {
        const Config config;

        EXPECT_EQ(config.analysis.token_budget, 4000u);
        EXPECT_EQ(config.analysis.chars_per_token, 4u);
        EXPECT_FALSE(config.analysis.database_only);
        EXPECT_EQ(config.builtin_libraries, (std::vector<std::string>{"WORK", "SASHELP", "SASUSER"}));
        EXPECT_EQ(config.output.format, "json");
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST(ConfigTest, LoadFromString) {
        const auto result = Config::load_from_string(R"(
[analysis]
token_budget = 2000
chars_per_token = 3
database_only = true

[libraries]
builtin = ["WORK", "STAGING"]

[macros]
builtin = ["log_step"]

[variables]
env = "PROD"
run_count = 3
dry_run = false

[output]
format = "markdown"
pretty = false
)");
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();

        const auto& config = result.value();
        EXPECT_EQ(config.analysis.token_budget, 2000u);
        EXPECT_EQ(config.analysis.chars_per_token, 3u);
        EXPECT_TRUE(config.analysis.database_only);
        EXPECT_FALSE(config.analysis.include_unused_libraries);
        EXPECT_EQ(config.builtin_libraries, (std::vector<std::string>{"WORK", "STAGING"}));
        EXPECT_EQ(config.builtin_macros, std::vector<std::string>{"log_step"});
        EXPECT_EQ(config.variables.at("ENV"), "PROD");
        EXPECT_EQ(config.variables.at("RUN_COUNT"), "3");
        EXPECT_EQ(config.variables.at("DRY_RUN"), "false");
        EXPECT_EQ(config.output.format, "markdown");
        EXPECT_FALSE(config.output.pretty);
    }

    TEST(ConfigTest, ToOptions) {
        Config config;
        config.analysis.token_budget = 500;
        config.analysis.include_unused_libraries = true;
        config.builtin_macros = {"LOG_STEP"};
        config.variables["ENV"] = "DEV";

        const auto options = config.to_options();
        EXPECT_EQ(options.token_budget, 500u);
        EXPECT_TRUE(options.include_unused_libraries);
        EXPECT_EQ(options.extra_builtin_macros, std::vector<std::string>{"LOG_STEP"});
        EXPECT_EQ(options.predefined_variables.at("ENV"), "DEV");
        EXPECT_EQ(options.builtin_libraries.size(), 3u);
    }

    TEST(ConfigTest, MalformedTomlIsParseError) {
        const auto result = Config::load_from_string("[analysis\ntoken_budget = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        ASSERT_TRUE(result.error().has_context());
        EXPECT_NE(result.error().context()->find("line"), std::string::npos);
    }

    TEST(ConfigTest, WrongTypesAreCollected) {
        const auto result = Config::load_from_string(
            "[analysis]\n"
            "token_budget = \"big\"\n"
            "database_only = 1\n"
            "[libraries]\n"
            "builtin = [\"WORK\", 3]\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);

        const auto& message = result.error().message();
        EXPECT_NE(message.find("analysis.token_budget must be an integer"), std::string::npos);
        EXPECT_NE(message.find("analysis.database_only must be a boolean"), std::string::npos);
        EXPECT_NE(message.find("libraries.builtin must be an array of strings"), std::string::npos);
    }

    TEST(ConfigTest, NegativeCountIsRejected) {
        const auto result = Config::load_from_string("[analysis]\ntoken_budget = -5\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().message().find("must not be negative"), std::string::npos);
    }

    TEST(ConfigTest, SectionMustBeTable) {
        const auto result = Config::load_from_string("analysis = 3\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().message().find("[analysis] must be a table"), std::string::npos);
    }

    TEST(ConfigTest, ValidationFailures) {
        const auto zero = Config::load_from_string("[analysis]\ntoken_budget = 0\n");
        ASSERT_TRUE(zero.is_err());
        EXPECT_EQ(zero.error().code(), ErrorCode::ConfigError);
        EXPECT_NE(zero.error().message().find("token_budget must be positive"), std::string::npos);

        Config config;
        config.output.format = "yaml";
        config.builtin_libraries.push_back("  ");
        const auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().message().find("got 'yaml'"), std::string::npos);
        EXPECT_NE(result.error().message().find("must not be blank"), std::string::npos);
    }

    TEST(ConfigTest, SerializedConfigLoadsBack) {
        Config config;
        config.analysis.token_budget = 1234;
        config.builtin_macros = {"LOG_STEP"};
        config.variables["ENV"] = "QA";
        config.output.format = "text";

        const auto reloaded = Config::load_from_string(config.to_string());
        ASSERT_TRUE(reloaded.is_ok()) << reloaded.error().to_string();
        EXPECT_EQ(reloaded.value().analysis.token_budget, 1234u);
        EXPECT_EQ(reloaded.value().builtin_macros, config.builtin_macros);
        EXPECT_EQ(reloaded.value().variables, config.variables);
        EXPECT_EQ(reloaded.value().output.format, "text");
    }

    TEST(ConfigTest, LoadFromFile) {
        const auto dir = fs::temp_directory_path() / "sasa_config_test";
        fs::remove_all(dir);
        const auto path = dir / "sasa.toml";

        ASSERT_TRUE(file_utils::write_file(path, "[analysis]\ntoken_budget = 64\n").is_ok());

        const auto result = Config::load_from_file(path);
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().analysis.token_budget, 64u);

        fs::remove_all(dir);
    }

    TEST(ConfigTest, MissingFileIsNotFound) {
        const auto result = Config::load_from_file("/nonexistent/sasa.toml");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

}  // namespace sasa::config
