#include "MockTransport.hpp"

namespace benchio {
namespace test {

MockTransport::MockTransport(TransportKind kind,
                             std::shared_ptr<MockTransportState> state)
    : kind_(kind), state_(std::move(state)) {}

void MockTransport::open() {
  if (state_->fail_open) {
    throw TransportError(ErrorKind::TransportOpenError, "mock open failure");
  }
  state_->is_open = true;
  ++state_->open_count;
}

void MockTransport::close() noexcept {
  if (!state_->is_open)
    return;
  state_->is_open = false;
  ++state_->close_count;
}

void MockTransport::write(const Frame &frame) {
  if (!state_->write_errors.empty()) {
    ErrorKind kind = state_->write_errors.front();
    state_->write_errors.pop_front();
    throw TransportError(kind, "mock write failure");
  }
  state_->written.push_back(frame);
}

Frame MockTransport::read(std::chrono::milliseconds timeout) {
  state_->read_timeouts.push_back(timeout);
  if (state_->on_read)
    state_->on_read();

  if (state_->inbound.empty()) {
    throw TransportError(ErrorKind::IoTimeout, "mock read timeout");
  }
  MockTransportState::Reply reply = state_->inbound.front();
  state_->inbound.pop_front();
  if (const auto *kind = std::get_if<ErrorKind>(&reply)) {
    throw TransportError(*kind, "mock read failure");
  }
  return std::get<Frame>(reply);
}

} // namespace test
} // namespace benchio
