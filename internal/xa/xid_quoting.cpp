#include "xid_quoting.hpp"

#include "internal/util/errors.hpp"

namespace txcoord::xa {

namespace {

void CheckLength(std::string_view xid, std::size_t max_bytes, std::string_view backend) {
  if (xid.empty()) {
    throw util::ProtocolError("xid must not be empty");
  }
  if (xid.size() > max_bytes) {
    throw util::ProtocolError(std::string(backend) + " xid exceeds " + std::to_string(max_bytes) + " bytes");
  }
}

} // namespace

std::string QuoteMySqlXid(std::string_view xid) {
  CheckLength(xid, kMySqlMaxXidBytes, "mysql");

  std::string out;
  out.reserve(xid.size() + 2);
  out.push_back('\'');
  for (char c : xid) {
    switch (c) {
      case '\'':
        out += "''";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\0':
        out += "\\0";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  out.push_back('\'');
  return out;
}

std::string QuotePostgresXid(std::string_view xid) {
  CheckLength(xid, kPostgresMaxXidBytes, "postgres");

  std::string out;
  out.reserve(xid.size() + 2);
  out.push_back('\'');
  for (char c : xid) {
    if (c == '\0') {
      throw util::ProtocolError("postgres xid must not contain NUL bytes");
    }
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace txcoord::xa
