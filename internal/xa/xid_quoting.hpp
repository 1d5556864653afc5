#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace txcoord::xa {

// MySQL XA gtrid limit.
inline constexpr std::size_t kMySqlMaxXidBytes = 64;
// PostgreSQL GIDSIZE is 200 including the terminator.
inline constexpr std::size_t kPostgresMaxXidBytes = 199;

/*
  Xid literals.

  The xid is the only caller-supplied text embedded into statements, so
  these two functions are the whole injection surface of the xa layer.
  Both return a complete single-quoted literal.
*/

// Doubles quotes and backslashes and writes NUL as \0, which MySQL's
// default sql_mode reads back unchanged. Throws util::ProtocolError for
// an empty xid or one longer than kMySqlMaxXidBytes.
std::string QuoteMySqlXid(std::string_view xid);

// Doubles quotes (standard_conforming_strings). NUL cannot be represented
// in a PostgreSQL text literal and is rejected with util::ProtocolError,
// as are empty xids and ones longer than kPostgresMaxXidBytes.
std::string QuotePostgresXid(std::string_view xid);

} // namespace txcoord::xa
