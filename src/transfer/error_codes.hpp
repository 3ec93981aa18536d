#pragma once

namespace transfer {

// Numeric codes carried in the terminal response's error.code.
//
//   RequestConstruction  2  bad URL, unsupported scheme, invalid header
//   LocalRead            3  temp file create, upload source open/read
//   LocalWrite           4  temp file write
//   LocalClose           5  temp file close
//   Transport            6  connection, TLS, timeout, aborted transfer
//
// A remote status failure (HTTP status >= 300) carries the status itself,
// which can never collide with the codes above.
enum class ErrorCode : int {
  RequestConstruction = 2,
  LocalRead = 3,
  LocalWrite = 4,
  LocalClose = 5,
  Transport = 6,
};

inline int to_wire(ErrorCode code) { return static_cast<int>(code); }

inline int remote_status_code(long http_status) {
  return static_cast<int>(http_status);
}

inline bool is_failure_status(long http_status) { return http_status >= 300; }

} // namespace transfer
