#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/connection.hpp"

namespace txcoord::db::memory {

class MemoryXaEngine;

class MemoryConnection final : public db::Connection {
 public:
  MemoryConnection(std::shared_ptr<MemoryXaEngine> engine, std::uint64_t id);
  ~MemoryConnection() override;

  bool IsHealthy() const override;

  void Execute(const std::string& sql) override;
  void Execute(const std::string& sql, const sql::Params& params) override;
  sql::ResultSet Query(const std::string& sql, const sql::Params& params = {}) override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::kQuestionMark;
  }

  std::uint64_t Id() const {
    return id_;
  }

 private:
  sql::ResultSet Run(const std::string& sql);

  std::shared_ptr<MemoryXaEngine> engine_;
  std::uint64_t                   id_;
  bool                            broken_ = false;
};

} // namespace txcoord::db::memory
