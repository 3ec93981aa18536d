// src/transport/line_stdio.hpp
#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace transport
{

    // Longest request line accepted from the controller: 1 MiB
    constexpr size_t kMaxLineBytes = 1024u * 1024u;

    // Reads one '\n'-terminated line (trailing '\r' stripped).
    // Returns:
    //  - true  => line read successfully into out (a final unterminated line counts)
    //  - false => EOF (err empty) or error (err non-empty)
    // An over-long line is consumed up to its newline before returning the error,
    // so the caller can keep reading.
    bool read_line(std::istream &in, std::string &out, std::string &err,
                   size_t max_len = kMaxLineBytes);

    // True when read_line failed on a recoverable line (too long) rather than
    // on the stream itself.
    bool is_recoverable(const std::istream &in);

    // Writes one line followed by a single '\n' and flushes.
    // Returns false on error and sets err.
    bool write_line(std::ostream &out, const std::string &line, std::string &err);

    // Makes writes to a closed stdout fail with EPIPE instead of killing the
    // process. Returns false on error and sets err.
    bool ignore_broken_pipe(std::string &err);

} // namespace transport
