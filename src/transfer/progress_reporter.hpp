#pragma once

#include <cstdint>
#include <string>

#include "../wire/response_writer.hpp"
#include "progress_sink.hpp"

namespace transfer {

// Emits one progress line per report, immediately. Frequency is bounded by
// the executor's chunk size, nothing else.
class ProgressReporter : public ProgressSink {
public:
  explicit ProgressReporter(wire::ResponseWriter &writer) : writer_(writer) {}

  void report(const std::string &oid, int64_t bytes_so_far,
              int64_t bytes_since_last) override;

  uint64_t reports_sent() const { return reports_sent_; }

private:
  wire::ResponseWriter &writer_;
  uint64_t reports_sent_ = 0;
};

} // namespace transfer
