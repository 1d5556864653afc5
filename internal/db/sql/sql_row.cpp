#include "internal/db/sql/sql_row.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace txcoord::db::sql {

const std::optional<std::string>& TextRow::Cell(int col) const {
  if (col < 0 || col >= ColumnCount()) {
    throw util::Fatal("column index " + std::to_string(col) + " out of range (" + std::to_string(ColumnCount()) + " columns)");
  }
  return cells_[static_cast<std::size_t>(col)];
}

std::string TextRow::GetText(int col) const {
  const auto& cell = Cell(col);
  return cell ? *cell : std::string{};
}

int TextRow::GetInt(int col) const {
  return static_cast<int>(GetInt64(col));
}

int64_t TextRow::GetInt64(int col) const {
  const auto& cell = Cell(col);
  if (!cell) return 0;

  int64_t value = 0;
  const auto* begin = cell->data();
  const auto* end   = cell->data() + cell->size();
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    throw util::Fatal("column " + std::to_string(col) + " is not an integer: '" + *cell + "'");
  }
  return value;
}

bool TextRow::IsNull(int col) const {
  return !Cell(col).has_value();
}

}
