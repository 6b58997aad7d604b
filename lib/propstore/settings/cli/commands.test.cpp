/* Copyright (c) 2025 The propstore authors */

#include <propstore/common/test.hpp>
#include "common.hpp"

namespace {
    using namespace propstore;
    using namespace std::string_literals;

    int run_cmd(std::initializer_list<const char *> args)
    {
        std::vector<const char *> argv { "propstore" };
        argv.insert(argv.end(), args.begin(), args.end());
        return cli::run(static_cast<int>(argv.size()), argv.data());
    }
}

suite propstore_settings_cli_suite = [] {
    "propstore::settings::cli"_test = [] {
        const test_dir tmp_dir { "test-propstore-cli" };
        const auto path = tmp_dir.file("app.properties");
        "registered"_test = [] {
            for (const auto *name: { "prop-check", "prop-get", "prop-list", "prop-remove", "prop-set" })
                expect(cli::command::registry().contains(name)) << name;
        };
        "prop-set creates the file"_test = [&] {
            expect_equal(0, run_cmd({ "prop-set", path.c_str(), "HttpPort", "8081" }));
            expect_equal(0, run_cmd({ "prop-set", path.c_str(), "LogLevel", "Debug", "Info", "Warn" }));
            expect_equal(0, run_cmd({ "prop-set", path.c_str(), "Single", "one", "--list" }));
            expect_equal("HttpPort = 8081\nLogLevel = Debug,Info,Warn\nSingle = one\n"s, file::read(path));
        };
        "prop-set rejects invalid keys"_test = [&] {
            expect_equal(1, run_cmd({ "prop-set", path.c_str(), "a=b", "x" }));
            expect_equal(1, run_cmd({ "prop-set", path.c_str(), "Key" }));
            expect_equal("HttpPort = 8081\nLogLevel = Debug,Info,Warn\nSingle = one\n"s, file::read(path));
        };
        "prop-get"_test = [&] {
            expect_equal(0, run_cmd({ "prop-get", path.c_str(), "HttpPort" }));
            expect_equal(0, run_cmd({ "prop-get", path.c_str(), "LogLevel" }));
            expect_equal(1, run_cmd({ "prop-get", path.c_str(), "Missing" }));
            const auto missing_path = tmp_dir.file("missing.properties");
            expect_equal(1, run_cmd({ "prop-get", missing_path.c_str(), "HttpPort" }));
        };
        "prop-list"_test = [&] {
            expect_equal(0, run_cmd({ "prop-list", path.c_str() }));
        };
        "prop-remove"_test = [&] {
            expect_equal(0, run_cmd({ "prop-remove", path.c_str(), "Single" }));
            expect_equal(1, run_cmd({ "prop-remove", path.c_str(), "Single" }));
            expect_equal("HttpPort = 8081\nLogLevel = Debug,Info,Warn\n"s, file::read(path));
        };
        "prop-check"_test = [&] {
            const auto messy_path = tmp_dir.file("messy.properties");
            file::write(messy_path, "# settings\n  b=2\r\na   =  x , y\nb = 3\n");
            expect_equal(0, run_cmd({ "prop-check", messy_path.c_str() }));
            expect_equal("# settings\n  b=2\r\na   =  x , y\nb = 3\n"s, file::read(messy_path));
            expect_equal(0, run_cmd({ "prop-check", messy_path.c_str(), "--normalize" }));
            expect_equal("a = x,y\nb = 3\n"s, file::read(messy_path));
            const auto bad_path = tmp_dir.file("bad.properties");
            file::write(bad_path, "ok = 1\nbroken\n= empty key\n");
            expect_equal(1, run_cmd({ "prop-check", bad_path.c_str(), "--normalize" }));
            expect_equal("ok = 1\nbroken\n= empty key\n"s, file::read(bad_path));
        };
    };
};
