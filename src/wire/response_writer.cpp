#include "response_writer.hpp"

#include <string>

#include "../transport/line_stdio.hpp"
#include "codec.hpp"

namespace wire {

bool ResponseWriter::send(const Response &resp) {
  std::string line;
  std::string err;

  if (!encode_response(resp, line, err)) {
    ++failures_;
    diag_.error("cannot encode response: " + err);
    return false;
  }

  if (!transport::write_line(out_, line, err)) {
    ++failures_;
    diag_.error("cannot send response: " + err);
    return false;
  }

  ++lines_written_;
  diag_.debug("sent " + line);
  return true;
}

} // namespace wire
