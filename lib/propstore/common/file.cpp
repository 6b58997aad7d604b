/* Copyright (c) 2025 The propstore authors */

#include <array>
#include "file.hpp"

namespace propstore::file {
    read_stream::read_stream(const std::string &path):
        _path { path },
        _f { std::fopen(path.c_str(), "rb") }
    {
        if (!_f) [[unlikely]]
            throw error_io(fmt::format("failed to open {} for reading", _path));
    }

    read_stream::~read_stream()
    {
        std::fclose(_f);
    }

    size_t read_stream::try_read(char *data, const size_t max_sz)
    {
        const auto num_read = std::fread(data, 1, max_sz, _f);
        if (num_read < max_sz && std::ferror(_f)) [[unlikely]]
            throw error_io(fmt::format("failed to read from {}", _path));
        return num_read;
    }

    std::string read_stream::read_all()
    {
        std::string res {};
        std::array<char, 0x4000> chunk;
        for (;;) {
            const auto num_read = try_read(chunk.data(), chunk.size());
            if (num_read == 0)
                break;
            res.append(chunk.data(), num_read);
        }
        return res;
    }

    write_stream::write_stream(const std::string &path):
        _path { path },
        _f { std::fopen(path.c_str(), "wb") }
    {
        if (!_f) [[unlikely]]
            throw error_io(fmt::format("failed to open {} for writing", _path));
    }

    write_stream::~write_stream()
    {
        if (_f)
            std::fclose(_f);
    }

    void write_stream::write(const std::string_view data)
    {
        if (!_f) [[unlikely]]
            throw error(fmt::format("write to an already closed stream {}", _path));
        if (data.empty())
            return;
        if (std::fwrite(data.data(), 1, data.size(), _f) != data.size()) [[unlikely]]
            throw error_io(fmt::format("failed to write {} bytes to {}", data.size(), _path));
    }

    void write_stream::close()
    {
        if (!_f)
            return;
        const auto flush_res = std::fflush(_f);
        const auto close_res = std::fclose(_f);
        _f = nullptr;
        if (flush_res != 0 || close_res != 0) [[unlikely]]
            throw error_io(fmt::format("failed to flush and close {}", _path));
    }

    std::string read(const std::string &path)
    {
        read_stream is { path };
        return is.read_all();
    }

    void write(const std::string &path, const std::string_view data)
    {
        write_stream os { path };
        os.write(data);
        os.close();
    }
}
