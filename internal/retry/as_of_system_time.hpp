#pragma once

#include <string>
#include <string_view>

namespace txcoord::retry {

// Renders an AS OF SYSTEM TIME operand: quoted literals and expressions
// such as follower_read_timestamp() pass through, a bare interval
// ("-5s", "2024-01-01 00:00:00") becomes a string literal.
// Throws std::invalid_argument when empty.
std::string FormatAsOfInterval(std::string_view interval);

/*
  Places "AS OF SYSTEM TIME <interval>" at the end of the top-level FROM
  clause of a read-only query: before the first top-level WHERE, GROUP
  BY, HAVING, ORDER BY, LIMIT or OFFSET, otherwise at the end. Quoted
  text, comments and parenthesized subqueries are skipped while scanning
  and a trailing ';' is kept.

  Throws std::invalid_argument when the query has no top-level FROM.
*/
std::string RewriteAsOfSystemTime(std::string_view query, std::string_view interval);

} // namespace txcoord::retry
