#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace propstore {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
#ifdef PROPSTORE_STACKTRACE
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
#endif
    };

    struct error: base_error {
        explicit error(std::string_view msg);
    };

    // captures errno at the construction time
    struct error_sys: error {
        explicit error_sys(std::string_view msg);

        // zero when the failure was not reported through errno
        int code() const noexcept
        {
            return _code;
        }
    protected:
        error_sys(std::string_view msg, int code);
    private:
        int _code;
    };

    struct error_io: error_sys {
        explicit error_io(std::string_view msg);
        // for failures of C++ streams, which do not set errno
        error_io(std::string_view msg, int code);
    };
}
