#pragma once
#include <stdexcept>
#include <string>

namespace hexrot {

// Connect refused or timed out, not connected, or connection lost while waiting.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The controller replied NO_ACK. reason() is the text it sent (possibly truncated).
class CommandRejected : public std::runtime_error {
public:
  explicit CommandRejected(const std::string& reason)
    : std::runtime_error(reason), reason_(reason) {}

  const std::string& reason() const noexcept { return reason_; }

private:
  std::string reason_;
};

// No matching CommandStatus arrived within the command timeout.
class CommandTimeout : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace hexrot
