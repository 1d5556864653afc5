#include "xa_session.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::xa {

using observability::BytesField;
using observability::StringField;

XaSession::XaSession(std::string xid, std::shared_ptr<db::Connection> connection)
    : xid_(std::move(xid)), connection_(std::move(connection)), state_(XaState::kStarted) {
}

XaSession::XaSession(XaSession&& other) noexcept
    : xid_(std::move(other.xid_)), connection_(std::move(other.connection_)), state_(other.state_) {
}

XaSession& XaSession::operator=(XaSession&& other) noexcept {
  if (this != &other) {
    Abandon();
    xid_        = std::move(other.xid_);
    connection_ = std::move(other.connection_);
    state_      = other.state_;
  }
  return *this;
}

XaSession::~XaSession() {
  Abandon();
}

db::Connection& XaSession::Connection() {
  if (!connection_) {
    throw util::InvalidState("xa session for xid has no connection (already " + std::string(ToString(state_)) + ")");
  }
  return *connection_;
}

void XaSession::Abandon() {
  if (!connection_) return;

  connection_->Poison();
  TXCOORD_LOG_WARN("XA session dropped before a terminal state; discarding its connection",
                   {BytesField("xid", xid_), StringField("state", ToString(state_))});
  connection_.reset();
}

void XaSession::Finish(XaState terminal) {
  state_ = terminal;
  connection_.reset();
}

} // namespace txcoord::xa
