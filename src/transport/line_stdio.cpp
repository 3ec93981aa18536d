// src/transport/line_stdio.cpp
#include "line_stdio.hpp"

#include <csignal>

namespace transport
{

    bool read_line(std::istream &in, std::string &out, std::string &err, size_t max_len)
    {
        err.clear();
        out.clear();

        std::istream::sentry guard(in, true);
        if (!guard)
        {
            // Clean EOF, or a stream that already failed
            if (!in.eof())
            {
                err = "input stream failure";
            }
            return false;
        }

        std::streambuf *buf = in.rdbuf();
        bool too_long = false;
        bool saw_any = false;

        while (true)
        {
            const int c = buf->sbumpc();
            if (c == std::char_traits<char>::eof())
            {
                in.setstate(std::ios::eofbit);
                break;
            }
            saw_any = true;
            if (c == '\n')
            {
                break;
            }
            if (out.size() >= max_len)
            {
                // Keep draining so the next read starts on a fresh line
                too_long = true;
                continue;
            }
            out.push_back(static_cast<char>(c));
        }

        if (!saw_any)
        {
            return false;
        }

        if (too_long)
        {
            out.clear();
            err = "line length exceeds max (" + std::to_string(max_len) + " bytes)";
            return false;
        }

        if (!out.empty() && out.back() == '\r')
        {
            out.pop_back();
        }
        return true;
    }

    bool is_recoverable(const std::istream &in)
    {
        return !in.bad() && !in.fail();
    }

    bool write_line(std::ostream &out, const std::string &line, std::string &err)
    {
        err.clear();

        if (line.find('\n') != std::string::npos)
        {
            err = "line payload contains a newline";
            return false;
        }

        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        if (!out.good())
        {
            err = "failed writing line payload";
            return false;
        }

        out.put('\n');
        if (!out.good())
        {
            err = "failed writing line terminator";
            return false;
        }

        out.flush();
        if (!out.good())
        {
            err = "failed flushing output";
            return false;
        }

        return true;
    }

    bool ignore_broken_pipe(std::string &err)
    {
        err.clear();
        if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR)
        {
            err = "failed to ignore SIGPIPE";
            return false;
        }
        return true;
    }

} // namespace transport
