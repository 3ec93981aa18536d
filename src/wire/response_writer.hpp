#pragma once

#include <cstdint>
#include <ostream>

#include "../diagnostics.hpp"
#include "messages.hpp"

namespace wire {

// Encodes responses and writes them to the controller, one flushed line each.
// Failures are diagnostics only: a response that cannot be encoded or
// written cannot be reported over the same channel.
class ResponseWriter {
public:
  ResponseWriter(std::ostream &out, relay_adapter::Diagnostics &diag)
      : out_(out), diag_(diag) {}

  bool send(const Response &resp);

  uint64_t lines_written() const { return lines_written_; }
  uint64_t failures() const { return failures_; }

private:
  std::ostream &out_;
  relay_adapter::Diagnostics &diag_;
  uint64_t lines_written_ = 0;
  uint64_t failures_ = 0;
};

} // namespace wire
