#include "memory_connection.hpp"

#include "internal/db/memory/memory_xa_engine.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::db::memory {

namespace {

std::string QuoteLiteral(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') quoted.push_back(c);
    quoted.push_back(c);
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace

MemoryConnection::MemoryConnection(std::shared_ptr<MemoryXaEngine> engine, std::uint64_t id) : engine_(std::move(engine)), id_(id) {
}

MemoryConnection::~MemoryConnection() {
  engine_->Disconnect(id_);
}

bool MemoryConnection::IsHealthy() const {
  return !broken_ && engine_->IsAvailable();
}

sql::ResultSet MemoryConnection::Run(const std::string& sql) {
  if (broken_) {
    throw util::ConnectionError("memory connection " + std::to_string(id_) + " is broken");
  }
  try {
    return engine_->Run(id_, sql);
  } catch (const util::ConnectionError&) {
    broken_ = true;
    throw;
  }
}

void MemoryConnection::Execute(const std::string& sql) {
  (void)Run(sql);
}

void MemoryConnection::Execute(const std::string& sql, const sql::Params& params) {
  (void)Query(sql, params);
}

sql::ResultSet MemoryConnection::Query(const std::string& sql, const sql::Params& params) {
  if (params.empty()) {
    return Run(sql);
  }
  return Run(sql::Interpolate(sql, params, QuoteLiteral));
}

} // namespace txcoord::db::memory
