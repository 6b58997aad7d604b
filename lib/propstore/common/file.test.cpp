/* Copyright (c) 2025 The propstore authors */

#include "test.hpp"

namespace {
    using namespace propstore;
    using namespace std::string_literals;
}

suite propstore_common_file_suite = [] {
    "propstore::common::file"_test = [] {
        const test_dir dir { "test-propstore-file" };
        "write and read"_test = [&] {
            const auto path = dir.file("data.txt");
            file::write(path, "first line\nsecond line\n");
            expect_equal("first line\nsecond line\n"s, file::read(path));
            file::write(path, "short");
            expect_equal("short"s, file::read(path));
            file::write(path, "");
            expect_equal(""s, file::read(path));
        };
        "large files"_test = [&] {
            const auto path = dir.file("large.txt");
            const std::string data(100'000, 'x');
            file::write(path, data);
            expect_equal(data.size(), file::read(path).size());
        };
        "missing files"_test = [&] {
            expect(throws<error_io>([&] { (void)file::read(dir.file("missing.txt")); }));
            expect(throws<error_io>([&] { file::write((dir.path() / "no-dir" / "x.txt").string(), "x"); }));
        };
        "a closed stream"_test = [&] {
            const auto path = dir.file("closed.txt");
            file::write_stream os { path };
            os.write("abc");
            os.close();
            os.close();
            expect(throws<error>([&] { os.write("def"); }));
            expect_equal("abc"s, file::read(path));
        };
        "test_dir"_test = [] {
            std::filesystem::path path {};
            {
                const test_dir t { "test-propstore-test-dir" };
                path = t.path();
                expect(std::filesystem::is_directory(path));
                file::write(t.file("inner.txt"), "x");
            }
            expect(!std::filesystem::exists(path));
        };
    };
};
