#ifndef HBT_DB_RAW_QUERY_HPP
#define HBT_DB_RAW_QUERY_HPP

#include <cstdint>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

namespace hbt_db
{

/**
 * @brief Prepare SQL against the connection behind a cpp_sqlite Database
 *
 * For the filtered queries, updates and deletes the DAOs do not cover. Rows
 * are read back with cpp_sqlite::Database::select<T>() on the returned
 * statement.
 *
 * @throws std::runtime_error with the SQLite message if preparation fails
 */
[[nodiscard]] cpp_sqlite::PreparedSQLStmt prepare(cpp_sqlite::Database& db,
                                                  const std::string& sql);

/**
 * @brief Bind a positional parameter, 1-based
 * @throws std::runtime_error if SQLite rejects the binding
 */
void bind(cpp_sqlite::PreparedSQLStmt& stmt,
          int index,
          const std::string& value);
void bind(cpp_sqlite::PreparedSQLStmt& stmt, int index, double value);
void bind(cpp_sqlite::PreparedSQLStmt& stmt, int index, uint32_t value);

/**
 * @brief Run a statement that returns no rows
 * @return Number of rows inserted, updated or deleted
 * @throws std::runtime_error with the SQLite message on failure
 */
int execute(cpp_sqlite::Database& db, cpp_sqlite::PreparedSQLStmt& stmt);

/// prepare() and execute() for SQL without parameters
int execute(cpp_sqlite::Database& db, const std::string& sql);

}  // namespace hbt_db

#endif  // HBT_DB_RAW_QUERY_HPP
