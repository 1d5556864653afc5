#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace txcoord::db::sql {

/*
  Generic row reader.

  Drivers materialize their native rows (pqxx::row, MYSQL_ROW,
  sqlite3_stmt) into TextRow before the statement handle is released, so
  driver types never leak into xa/ or retry/ logic.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int GetInt(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual bool IsNull(int col) const = 0;
  virtual int ColumnCount() const = 0;

  uint64_t GetU64(int col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }
};

// Binary-safe: GetText returns the raw bytes, embedded NULs included.
class TextRow final : public Row {
public:
  TextRow() = default;
  explicit TextRow(std::vector<std::optional<std::string>> cells) : cells_(std::move(cells)) {}

  std::string GetText(int col) const override;
  int GetInt(int col) const override;
  int64_t GetInt64(int col) const override;
  bool IsNull(int col) const override;
  int ColumnCount() const override { return static_cast<int>(cells_.size()); }

  void Append(std::optional<std::string> cell) { cells_.push_back(std::move(cell)); }

private:
  const std::optional<std::string>& Cell(int col) const;

  std::vector<std::optional<std::string>> cells_;
};

using ResultSet = std::vector<TextRow>;

}
