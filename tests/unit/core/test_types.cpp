//
// Created by gregorian-rayne on 1/6/26.
//

#include "sasa/types.hpp"

#include <gtest/gtest.h>
#include <string>

namespace sasa
{
    TEST(DatabaseTypeTest, KnownEngines) {
        EXPECT_EQ(database_type_from_engine("oracle"), DatabaseType::Oracle);
        EXPECT_EQ(database_type_from_engine("TERADATA"), DatabaseType::Teradata);
        EXPECT_EQ(database_type_from_engine("sqlsvr"), DatabaseType::SqlServer);
        EXPECT_EQ(database_type_from_engine("bigquery"), DatabaseType::BigQuery);
        EXPECT_EQ(database_type_from_engine("Db2"), DatabaseType::Db2);
        EXPECT_EQ(database_type_from_engine("postgres"), DatabaseType::Postgres);
        EXPECT_EQ(database_type_from_engine("snow"), DatabaseType::Snowflake);
        EXPECT_EQ(database_type_from_engine("v9"), DatabaseType::Base);
    }

    TEST(DatabaseTypeTest, UnknownEngineIsGeneric) {
        EXPECT_EQ(database_type_from_engine("hadoop"), DatabaseType::Generic);
        EXPECT_EQ(database_type_from_engine(""), DatabaseType::Generic);
    }

    TEST(DatabaseTypeTest, ToString) {
        EXPECT_STREQ(to_string(DatabaseType::Oracle), "oracle");
        EXPECT_STREQ(to_string(DatabaseType::Teradata), "teradata");
        EXPECT_STREQ(to_string(DatabaseType::Generic), "generic");
    }

    TEST(TableOperationTest, ToString) {
        EXPECT_STREQ(to_string(TableOperation::Select), "SELECT");
        EXPECT_STREQ(to_string(TableOperation::CreateTable), "CREATE TABLE");
        EXPECT_STREQ(to_string(TableOperation::SelectInto), "SELECT INTO");
    }

    TEST(TableOperationTest, SetOrdersByDeclaration) {
        const OperationSet ops = {TableOperation::Update, TableOperation::Select, TableOperation::Insert};
        const std::vector<TableOperation> ordered(ops.begin(), ops.end());

        ASSERT_EQ(ordered.size(), 3u);
        EXPECT_EQ(ordered[0], TableOperation::Select);
        EXPECT_EQ(ordered[1], TableOperation::Insert);
        EXPECT_EQ(ordered[2], TableOperation::Update);
    }

    TEST(SourceSpanTest, LengthAndContains) {
        const SourceSpan span{10, 20, 1, 2};

        EXPECT_EQ(span.length(), 10u);
        EXPECT_TRUE(span.contains(10));
        EXPECT_TRUE(span.contains(19));
        EXPECT_FALSE(span.contains(20));
    }

}  // namespace sasa
