#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <filesystem>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#ifndef BOOST_UT_DISABLE_MODULE
#   define BOOST_UT_DISABLE_MODULE 1
#endif
#include <boost/ut.hpp>
#include "file.hpp"
#include "format.hpp"
#include "logger.hpp"

namespace propstore {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename X, typename Y>
    bool expect_equal(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    // A fresh directory under the system's temporary directory, removed together with the object
    struct test_dir {
        explicit test_dir(const std::string_view name):
            _path { std::filesystem::temp_directory_path() / name }
        {
            std::filesystem::remove_all(_path);
            std::filesystem::create_directories(_path);
        }

        test_dir(const test_dir &) =delete;
        test_dir &operator=(const test_dir &) =delete;

        ~test_dir()
        {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
            if (ec)
                logger::warn("failed to remove a test directory {}: {}", _path.string(), ec.message());
        }

        std::string file(const std::string_view name) const
        {
            return (_path / name).string();
        }

        const std::filesystem::path &path() const noexcept
        {
            return _path;
        }
    private:
        std::filesystem::path _path;
    };
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<propstore::test_printer>> {};
