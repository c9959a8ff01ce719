#pragma once

namespace flashback::catalog::mysql::remote_sql {

/*
  Statements sent to the source server while describing a table.
  Placeholders are filled with escaped values by MysqlCatalogSource.
*/

constexpr const char* SHOW_COLUMNS = "SHOW COLUMNS FROM %s";

constexpr const char* PRIMARY_KEY_CONSTRAINT_COLUMNS =
    "SELECT COLUMN_NAME FROM information_schema.KEY_COLUMN_USAGE "
    "WHERE TABLE_SCHEMA = '%s' AND TABLE_NAME = '%s' "
    "AND CONSTRAINT_NAME = 'PRIMARY' ORDER BY ORDINAL_POSITION";

constexpr const char* SHOW_PRIMARY_INDEX = "SHOW INDEX FROM %s WHERE Key_name = 'PRIMARY'";

} // namespace flashback::catalog::mysql::remote_sql
