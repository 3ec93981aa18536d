#pragma once

#include <cstdint>
#include <string>

namespace transfer {

// Receives byte-count updates while a transfer streams.
class ProgressSink {
public:
  virtual ~ProgressSink() = default;

  virtual void report(const std::string &oid, int64_t bytes_so_far,
                      int64_t bytes_since_last) = 0;
};

} // namespace transfer
