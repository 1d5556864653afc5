#include "mysql_connection.hpp"

#include <memory>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::db::mysql {

namespace {

struct ResultDeleter {
  void operator()(MYSQL_RES* result) const {
    mysql_free_result(result);
  }
};

using ResultHandle = std::unique_ptr<MYSQL_RES, ResultDeleter>;

const char* NullIfEmpty(const std::string& value) {
  return value.empty() ? nullptr : value.c_str();
}

} // namespace

MySqlConnection::MySqlConnection(const MySqlOptions& options) {
  handle_ = mysql_init(nullptr);
  if (handle_ == nullptr) {
    throw util::ConnectionError("mysql_init failed: out of memory");
  }

  const unsigned int timeout = static_cast<unsigned int>(options.connect_timeout.count());
  mysql_options(handle_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  mysql_options(handle_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

  if (mysql_real_connect(handle_, NullIfEmpty(options.host), NullIfEmpty(options.user), NullIfEmpty(options.password),
                         NullIfEmpty(options.database), options.port, NullIfEmpty(options.unix_socket), 0) == nullptr) {
    const std::string message = std::string("mysql connect: ") + mysql_error(handle_);
    mysql_close(handle_);
    handle_ = nullptr;
    throw util::ConnectionError(message);
  }
}

MySqlConnection::~MySqlConnection() {
  if (handle_) mysql_close(handle_);
}

void MySqlConnection::Fail(const std::string& what) {
  const unsigned int error_number = mysql_errno(handle_);
  const std::string  sqlstate     = mysql_sqlstate(handle_);
  const auto         code         = ClassifyMySqlError(error_number, sqlstate);
  if (code == ErrorCode::ConnectionLost) {
    broken_ = true;
  }
  Raise(code, "mysql " + what + " [" + std::to_string(error_number) + "/" + sqlstate + "]: " + mysql_error(handle_));
}

MYSQL_RES* MySqlConnection::Run(const std::string& sql) {
  if (handle_ == nullptr || broken_) {
    throw util::ConnectionError("mysql connection is closed");
  }
  if (mysql_real_query(handle_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
    Fail("query");
  }

  MYSQL_RES* result = mysql_store_result(handle_);
  if (result == nullptr && mysql_field_count(handle_) != 0) {
    Fail("store_result");
  }
  return result;
}

std::string MySqlConnection::Bind(const std::string& sql, const sql::Params& params) {
  return sql::Interpolate(sql, params, [this](const std::string& value) {
    std::string escaped(value.size() * 2 + 1, '\0');
    const auto  length = mysql_real_escape_string(handle_, escaped.data(), value.data(), static_cast<unsigned long>(value.size()));
    escaped.resize(length);
    return "'" + escaped + "'";
  });
}

void MySqlConnection::Execute(const std::string& sql) {
  ResultHandle result(Run(sql));
}

void MySqlConnection::Execute(const std::string& sql, const sql::Params& params) {
  ResultHandle result(Run(params.empty() ? sql : Bind(sql, params)));
}

sql::ResultSet MySqlConnection::Query(const std::string& sql, const sql::Params& params) {
  ResultHandle result(Run(params.empty() ? sql : Bind(sql, params)));
  if (!result) return {};

  const unsigned int columns = mysql_num_fields(result.get());
  sql::ResultSet     rows;
  rows.reserve(static_cast<std::size_t>(mysql_num_rows(result.get())));

  while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
    const unsigned long* lengths = mysql_fetch_lengths(result.get());
    sql::TextRow         text_row;
    for (unsigned int col = 0; col < columns; ++col) {
      if (row[col] == nullptr) {
        text_row.Append(std::nullopt);
      } else {
        text_row.Append(std::string(row[col], lengths[col]));
      }
    }
    rows.push_back(std::move(text_row));
  }
  return rows;
}

} // namespace txcoord::db::mysql
