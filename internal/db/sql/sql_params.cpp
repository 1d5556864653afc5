#include "internal/db/sql/sql_params.hpp"

#include <sstream>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace txcoord::db::sql {

namespace {

std::string Render(const Param& param, const LiteralQuoter& quote) {
  return std::visit(
      [&quote](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return quote(value);
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream out;
          out.precision(17);
          out << value;
          return out.str();
        } else {
          return std::to_string(value);
        }
      },
      param);
}

} // namespace

std::string Placeholder(PlaceholderStyle style, std::size_t index) {
  if (style == PlaceholderStyle::kDollarNumbered) {
    return "$" + std::to_string(index);
  }
  return "?";
}

std::string Interpolate(std::string_view sql, const Params& params, const LiteralQuoter& quote) {
  std::string out;
  out.reserve(sql.size() + params.size() * 8);

  std::size_t next  = 0;
  char        quote_char = '\0';
  for (std::size_t i = 0; i < sql.size(); ++i) {
    const char c = sql[i];

    if (quote_char != '\0') {
      out.push_back(c);
      if (c == '\\' && quote_char != '`' && i + 1 < sql.size()) {
        out.push_back(sql[++i]);
      } else if (c == quote_char) {
        quote_char = '\0';
      }
      continue;
    }

    if (c == '\'' || c == '"' || c == '`') {
      quote_char = c;
      out.push_back(c);
      continue;
    }

    if (c == '?') {
      if (next >= params.size()) {
        throw util::Fatal("statement has more placeholders than the " + std::to_string(params.size()) + " bound parameters");
      }
      out += Render(params[next++], quote);
      continue;
    }

    out.push_back(c);
  }

  if (next != params.size()) {
    throw util::Fatal("statement has " + std::to_string(next) + " placeholders but " + std::to_string(params.size()) +
                      " parameters were bound");
  }
  return out;
}

}
