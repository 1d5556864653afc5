#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace txcoord::db::sql {

/*
  Parameter abstraction.

  Postgres / CockroachDB: $1 $2 $3
  MySQL / SQLite:         ? ? ?

  Both use ordered binding. The xid is never passed this way: the XA
  keywords require it inline (see xa::XaDialect).
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

enum class PlaceholderStyle {
  kQuestionMark,
  kDollarNumbered,
};

// Placeholder text for the 1-based parameter `index`.
std::string Placeholder(PlaceholderStyle style, std::size_t index);

// Renders a string parameter as a complete, quoted SQL literal.
using LiteralQuoter = std::function<std::string(const std::string&)>;

// Client-side binding for drivers without a usable server-side protocol
// for ad-hoc statements: replaces each `?` outside quoted text with the
// rendered parameter. Throws util::Fatal on a count mismatch.
std::string Interpolate(std::string_view sql, const Params& params, const LiteralQuoter& quote);

}
