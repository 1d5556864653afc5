#pragma once

#include <cstdint>
#include <string>

namespace txcoord::xa {

// One row of a recovery query. Not linked to any live XaSession.
struct TransactionInfo {
  std::int64_t format_id    = 0;
  std::int64_t gtrid_length = 0;
  std::int64_t bqual_length = 0;
  std::string  data; // raw gtrid + bqual bytes
  std::string  xid;  // best-effort decode of data
};

} // namespace txcoord::xa
