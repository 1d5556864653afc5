#pragma once

#include <mysql.h>

#include <chrono>
#include <string>

#include "internal/db/api/connection.hpp"

namespace txcoord::db::mysql {

struct MySqlOptions {
  std::string   host;
  unsigned int  port = 3306;
  std::string   user;
  std::string   password;
  std::string   database;
  std::string   unix_socket;
  std::chrono::seconds connect_timeout{10};
};

/*
  libmysqlclient session.

  XA statements are only accepted over the text protocol, so everything
  goes through mysql_real_query. `?` parameters are bound client-side with
  mysql_real_escape_string, which honours the session character set and
  SQL mode.
*/
class MySqlConnection final : public db::Connection {
 public:
  explicit MySqlConnection(const MySqlOptions& options);
  ~MySqlConnection() override;

  MySqlConnection(const MySqlConnection&)            = delete;
  MySqlConnection& operator=(const MySqlConnection&) = delete;

  bool IsHealthy() const override {
    return handle_ != nullptr && !broken_;
  }

  void Execute(const std::string& sql) override;
  void Execute(const std::string& sql, const sql::Params& params) override;
  sql::ResultSet Query(const std::string& sql, const sql::Params& params = {}) override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::kQuestionMark;
  }

 private:
  MYSQL_RES*        Run(const std::string& sql);
  std::string       Bind(const std::string& sql, const sql::Params& params);
  [[noreturn]] void Fail(const std::string& what);

  MYSQL* handle_ = nullptr;
  bool   broken_ = false;
};

} // namespace txcoord::db::mysql
