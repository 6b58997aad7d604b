#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <cstdio>
#include <string>
#include <string_view>
#include "error.hpp"
#include "format.hpp"

namespace propstore::file {
    // Owns a FILE handle for the lifetime of the object; all failures are reported as error_io
    struct read_stream {
        explicit read_stream(const std::string &path);
        read_stream(const read_stream &) =delete;
        read_stream &operator=(const read_stream &) =delete;
        ~read_stream();

        std::string read_all();
    private:
        std::string _path;
        std::FILE *_f;

        // returns the number of bytes read; zero means the end of the file
        size_t try_read(char *data, size_t max_sz);
    };

    // Truncates the target. Call close() to learn whether buffered data reached the file.
    struct write_stream {
        explicit write_stream(const std::string &path);
        write_stream(const write_stream &) =delete;
        write_stream &operator=(const write_stream &) =delete;
        ~write_stream();

        void write(std::string_view data);
        void close();
    private:
        std::string _path;
        std::FILE *_f;
    };

    extern std::string read(const std::string &path);
    extern void write(const std::string &path, std::string_view data);
}
