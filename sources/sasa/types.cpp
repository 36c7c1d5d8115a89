//
// Created by gregorian-rayne on 12/28/25.
//

#include "sasa/types.hpp"
#include "sasa/utils/string_utils.hpp"

#include <array>
#include <utility>

namespace sasa {

    DatabaseType database_type_from_engine(const std::string_view engine) {
        static constexpr std::array<std::pair<std::string_view, DatabaseType>, 19> engines = {{
            {"oracle",     DatabaseType::Oracle},
            {"teradata",   DatabaseType::Teradata},
            {"sqlsvr",     DatabaseType::SqlServer},
            {"sqlserver",  DatabaseType::SqlServer},
            {"mssql",      DatabaseType::SqlServer},
            {"bigquery",   DatabaseType::BigQuery},
            {"bigqry",     DatabaseType::BigQuery},
            {"db2",        DatabaseType::Db2},
            {"postgres",   DatabaseType::Postgres},
            {"postgresql", DatabaseType::Postgres},
            {"mysql",      DatabaseType::MySql},
            {"snow",       DatabaseType::Snowflake},
            {"snowflake",  DatabaseType::Snowflake},
            {"odbc",       DatabaseType::Odbc},
            {"base",       DatabaseType::Base},
            {"v9",         DatabaseType::Base},
            {"v8",         DatabaseType::Base},
            {"v7",         DatabaseType::Base},
            {"spde",       DatabaseType::Base},
        }};

        const auto trimmed = string_utils::trim(engine);
        for (const auto& [name, type] : engines) {
            if (string_utils::iequals(trimmed, name)) {
                return type;
            }
        }
        return DatabaseType::Generic;
    }

}  // namespace sasa
