#include "pg_connection.hpp"

#include <type_traits>
#include <variant>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::db::postgres {

namespace {

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&out](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(value);
          }
        },
        param);
  }
  return out;
}

sql::ResultSet ToResultSet(const pqxx::result& result) {
  sql::ResultSet rows;
  rows.reserve(result.size());
  for (const auto& row : result) {
    sql::TextRow text_row;
    for (const auto& field : row) {
      if (field.is_null()) {
        text_row.Append(std::nullopt);
      } else {
        text_row.Append(std::string(field.c_str(), field.size()));
      }
    }
    rows.push_back(std::move(text_row));
  }
  return rows;
}

} // namespace

PgConnection::PgConnection(const std::string& conninfo) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo);
  } catch (const pqxx::broken_connection& e) {
    throw util::ConnectionError(std::string("postgres connect: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw util::ConnectionError(std::string("postgres connect: ") + e.what());
  }
}

PgConnection::~PgConnection() = default;

bool PgConnection::IsHealthy() const {
  return conn_ && conn_->is_open();
}

pqxx::result PgConnection::Run(const std::string& sql, const sql::Params* params) {
  try {
    pqxx::nontransaction tx(*conn_);
    if (params == nullptr || params->empty()) {
      return tx.exec(sql);
    }
    return tx.exec_params(sql, ToPqxx(*params));
  } catch (const pqxx::broken_connection& e) {
    throw util::ConnectionError(std::string("postgres: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    Raise(ClassifySqlState(e.sqlstate()), std::string("postgres [") + e.sqlstate() + "]: " + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    throw util::ConnectionError(std::string("postgres outcome in doubt: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw util::Fatal(std::string("postgres: ") + e.what());
  } catch (const pqxx::usage_error& e) {
    throw util::Fatal(std::string("postgres usage: ") + e.what());
  }
}

void PgConnection::Execute(const std::string& sql) {
  (void)Run(sql, nullptr);
}

void PgConnection::Execute(const std::string& sql, const sql::Params& params) {
  (void)Run(sql, &params);
}

sql::ResultSet PgConnection::Query(const std::string& sql, const sql::Params& params) {
  return ToResultSet(Run(sql, &params));
}

} // namespace txcoord::db::postgres
