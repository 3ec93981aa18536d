#include "progress_reporter.hpp"

namespace transfer {

void ProgressReporter::report(const std::string &oid, int64_t bytes_so_far,
                              int64_t bytes_since_last) {
  wire::ProgressResponse resp;
  resp.oid = oid;
  resp.bytes_so_far = bytes_so_far;
  resp.bytes_since_last = bytes_since_last;
  if (writer_.send(resp)) {
    ++reports_sent_;
  }
}

} // namespace transfer
