#include "sqlite_db.hpp"

#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"

namespace txcoord::db::sqlite {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

} // namespace

ErrorCode ClassifySqliteCode(int result_code) {
  switch (result_code & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
      return ErrorCode::ConnectionLost;
    case SQLITE_CONSTRAINT:
      return ErrorCode::AlreadyExists;
    case SQLITE_NOTFOUND:
      return ErrorCode::NotFound;
    default:
      return ErrorCode::InternalError;
  }
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::ConnectionError("sqlite open '" + options_.path + "': " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Fail(int rc, const std::string& what) const {
  const std::string message = what + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
  const auto        code    = ClassifySqliteCode(rc);
  Raise(code == ErrorCode::OK ? ErrorCode::InternalError : code, message);
}

void SqliteDB::Execute(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    const auto code = ClassifySqliteCode(rc);
    Raise(code == ErrorCode::OK ? ErrorCode::InternalError : code, msg);
  }
}

void SqliteDB::Execute(const std::string& sql, const sql::Params& params) {
  (void)Query(sql, params);
}

sql::ResultSet SqliteDB::Query(const std::string& sql, const sql::Params& params) {
  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
  Statement     stmt(raw);
  if (rc != SQLITE_OK) Fail(rc, "sqlite prepare");
  if (!stmt) return {};

  if (static_cast<int>(params.size()) != sqlite3_bind_parameter_count(stmt.get())) {
    throw util::Fatal("sqlite statement expects " + std::to_string(sqlite3_bind_parameter_count(stmt.get())) +
                      " parameters, got " + std::to_string(params.size()));
  }

  for (std::size_t i = 0; i < params.size(); ++i) {
    const int index = static_cast<int>(i) + 1;
    rc              = std::visit(
        [&](const auto& value) -> int {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt.get(), index);
          } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt.get(), index, value);
          } else {
            return sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(value));
          }
        },
        params[i]);
    if (rc != SQLITE_OK) Fail(rc, "sqlite bind");
  }

  sql::ResultSet rows;
  for (;;) {
    rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) Fail(rc, "sqlite step");

    const int    columns = sqlite3_column_count(stmt.get());
    sql::TextRow row;
    for (int col = 0; col < columns; ++col) {
      if (sqlite3_column_type(stmt.get(), col) == SQLITE_NULL) {
        row.Append(std::nullopt);
        continue;
      }
      const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt.get(), col));
      const int   size = sqlite3_column_bytes(stmt.get(), col);
      row.Append(std::string(data ? data : "", static_cast<std::size_t>(size)));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Execute("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Execute("PRAGMA synchronous=NORMAL;");

  Execute("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count()));
  if (rc != SQLITE_OK) Fail(rc, "busy_timeout");
}

} // namespace txcoord::db::sqlite
