#pragma once

#include <string>

#include "messages.hpp"

namespace wire {

enum class DecodeStatus {
  Ok,
  InvalidJson,    // not JSON, or a field has the wrong JSON type
  UnknownCommand, // missing or unrecognised "id"
  InvalidField    // known command, field invariant violated
};

const char *decode_status_name(DecodeStatus status);

// Decodes one request line. On anything but Ok, err describes the problem and
// out is left untouched.
DecodeStatus decode_request(const std::string &line, Request &out,
                            std::string &err);

// Encodes one response as a single JSON line (no trailing newline).
// Returns false on error and sets err.
bool encode_response(const Response &resp, std::string &line, std::string &err);

} // namespace wire
