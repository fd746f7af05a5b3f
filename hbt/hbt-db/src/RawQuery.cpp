#include "hbt-db/src/RawQuery.hpp"

#include <stdexcept>

#include <sqlite3.h>

namespace hbt_db
{

namespace
{

void checkBind(int result, int index)
{
  if (result != SQLITE_OK)
  {
    throw std::runtime_error("Failed to bind parameter " +
                             std::to_string(index) + ": " +
                             sqlite3_errstr(result));
  }
}

}  // namespace

cpp_sqlite::PreparedSQLStmt prepare(cpp_sqlite::Database& db,
                                    const std::string& sql)
{
  sqlite3_stmt* rawPtr = nullptr;
  int const result = sqlite3_prepare_v2(
    &db.getRawDB(), sql.c_str(), -1, &rawPtr, nullptr);

  if (result != SQLITE_OK)
  {
    sqlite3_finalize(rawPtr);
    throw std::runtime_error("Failed to prepare statement: " +
                             std::string{sqlite3_errmsg(&db.getRawDB())} +
                             "\nQuery: " + sql);
  }

  return cpp_sqlite::PreparedSQLStmt{rawPtr, sqlite3_finalize};
}

void bind(cpp_sqlite::PreparedSQLStmt& stmt,
          int index,
          const std::string& value)
{
  checkBind(sqlite3_bind_text(
              stmt.get(), index, value.c_str(), -1, SQLITE_TRANSIENT),
            index);
}

void bind(cpp_sqlite::PreparedSQLStmt& stmt, int index, double value)
{
  checkBind(sqlite3_bind_double(stmt.get(), index, value), index);
}

void bind(cpp_sqlite::PreparedSQLStmt& stmt, int index, uint32_t value)
{
  checkBind(
    sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(value)),
    index);
}

int execute(cpp_sqlite::Database& db, cpp_sqlite::PreparedSQLStmt& stmt)
{
  int result = sqlite3_step(stmt.get());
  while (result == SQLITE_ROW)
  {
    result = sqlite3_step(stmt.get());
  }

  if (result != SQLITE_DONE)
  {
    throw std::runtime_error("Failed to execute statement: " +
                             std::string{sqlite3_errmsg(&db.getRawDB())});
  }
  return sqlite3_changes(&db.getRawDB());
}

int execute(cpp_sqlite::Database& db, const std::string& sql)
{
  auto stmt = prepare(db, sql);
  return execute(db, stmt);
}

}  // namespace hbt_db
