/* Copyright (c) 2025 The propstore authors */

#include <cerrno>
#include <cstring>
#include "error.hpp"
#include "format.hpp"

#ifdef PROPSTORE_STACKTRACE
#   include <boost/interprocess/streams/bufferstream.hpp>
#   include <boost/stacktrace.hpp>
#   include "logger.hpp"
#endif

namespace propstore {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
#ifdef PROPSTORE_STACKTRACE
        // skips top 3 frames: safe_dump, base_error, and error
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
#endif
    }

    const char *base_error::what() const noexcept
    {
#ifdef PROPSTORE_STACKTRACE
        thread_local std::array<char, 0x2000> buf {};
        boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
        os << _msg << '\n';
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size()) << '\n';
        // the bufferstream's constructor arguments ensure that there is always at least one byte available.
        buf[os.buffer().second] = 0;
        logger::debug("stacktrace for a user visible exception: {}", buf.data());
#endif
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error_sys { msg, errno }
    {
    }

    static std::string sys_message(const std::string_view msg, const int code)
    {
        if (code == 0)
            return std::string { msg };
        return fmt::format("{} errno: {} strerror: {}", msg, code, std::strerror(code));
    }

    error_sys::error_sys(const std::string_view msg, const int code)
        : error { sys_message(msg, code) },
        _code { code }
    {
    }

    error_io::error_io(const std::string_view msg)
        : error_sys { msg }
    {
    }

    error_io::error_io(const std::string_view msg, const int code)
        : error_sys { msg, code }
    {
    }
}
