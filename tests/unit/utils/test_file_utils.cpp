//
// Created by gregorian-rayne on 1/6/26.
//

#include "sasa/utils/file_utils.hpp"
#include "sasa/utils/json_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace sasa
{
    class FileUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "sasa_file_utils_test";
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir, ec);
        }

        fs::path temp_dir;
    };

    TEST_F(FileUtilsTest, WriteThenRead) {
        const auto path = temp_dir / "nested" / "job.sas";

        ASSERT_TRUE(file_utils::write_file(path, "data x; run;\n").is_ok());

        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "data x; run;\n");
    }

    TEST_F(FileUtilsTest, MissingFileIsNotFound) {
        const auto content = file_utils::read_file(temp_dir / "missing.sas");

        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
    }

    TEST_F(FileUtilsTest, ReadStream) {
        std::istringstream in("%let a = 1;");
        const auto content = file_utils::read_stream(in);

        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "%let a = 1;");
    }

    TEST_F(FileUtilsTest, DirectoryIsNotAFile) {
        const auto content = file_utils::read_file(temp_dir);

        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
    }

    TEST_F(FileUtilsTest, WriteReplacesExistingContent) {
        const auto path = temp_dir / "chunk_000.sas";

        ASSERT_TRUE(file_utils::write_file(path, "proc sql; quit;\n").is_ok());
        ASSERT_TRUE(file_utils::write_file(path, "run;").is_ok());

        EXPECT_EQ(file_utils::read_file(path).value(), "run;");
    }

    TEST(JsonUtilsTest, ParseFailureIsParseError) {
        const auto parsed = json_utils::parse("{\"databases\": [");

        ASSERT_TRUE(parsed.is_err());
        EXPECT_EQ(parsed.error().code(), ErrorCode::ParseError);
    }

    TEST(JsonUtilsTest, CompactToString) {
        const auto parsed = json_utils::parse(R"({"a": [1, 2]})");

        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(json_utils::to_string(parsed.value()), R"({"a":[1,2]})");
    }

}  // namespace sasa
