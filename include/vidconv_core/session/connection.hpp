#pragma once

#include <cstdint>
#include <string>

namespace vidconv_core {

using ConnectionId = std::uint64_t;

/**
 * @class Connection
 * @brief Transport-neutral handle to one client's bidirectional message channel.
 *
 * Implementations must tolerate send_text() from worker threads at any time,
 * including after the channel closed (the message is dropped then).
 */
class Connection {
 public:
  virtual ~Connection() = default;

  virtual void send_text(const std::string& message) = 0;

  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
};

}  // namespace vidconv_core
