/* Copyright (c) 2025 The propstore authors */

#include <istream>
#include <iterator>
#include <ostream>
#include <propstore/common/file.hpp>
#include <propstore/common/logger.hpp>
#include "store.hpp"

namespace propstore::settings {
    static bool is_space(const char c)
    {
        return c == ' ' || c == '\t' || c == '\f' || c == '\v';
    }

    static void validate_key(const std::string_view key)
    {
        if (key.empty()) [[unlikely]]
            throw err_invalid_key_t { key, "must not be empty" };
        if (key.find('=') != std::string_view::npos) [[unlikely]]
            throw err_invalid_key_t { key, "must not contain '='" };
        if (key.find_first_of("\r\n") != std::string_view::npos) [[unlikely]]
            throw err_invalid_key_t { key, "must not contain line breaks" };
        if (key.front() == '#' || key.front() == '!') [[unlikely]]
            throw err_invalid_key_t { key, "must not start with a comment marker" };
        if (is_space(key.front()) || is_space(key.back())) [[unlikely]]
            throw err_invalid_key_t { key, "must not start or end with whitespace" };
    }

    static void validate_value(const std::string_view key, const std::string_view value)
    {
        if (value.find_first_of("\r\n") != std::string_view::npos) [[unlikely]]
            throw err_invalid_value_t { key, "must not contain line breaks" };
    }

    struct store_t::impl {
        explicit impl(codec::format_ptr_t format):
            _format { std::move(format) }
        {
            if (!_format) [[unlikely]]
                throw error("a settings store requires a format!");
        }

        void set(const std::string_view key, value_t val)
        {
            if (const auto it = _table.find(key); it != _table.end())
                it->second = std::move(val);
            else
                _table.emplace(std::string { key }, std::move(val));
        }

        template<typename T>
        std::optional<T> get(const std::string_view key) const
        {
            if (const auto it = _table.find(key); it != _table.end()) {
                if (const auto *val = std::get_if<T>(&it->second))
                    return *val;
            }
            return {};
        }

        bool erase(const std::string_view key)
        {
            if (const auto it = _table.find(key); it != _table.end()) {
                _table.erase(it);
                return true;
            }
            return false;
        }

        diagnostics_t load(const std::string_view text, const std::string_view source)
        {
            auto res = _format->parse(text);
            _table = std::move(res.table);
            logger::trace("loaded {} properties from {} with {} warning(s)", _table.size(), source, res.warnings.size());
            return std::move(res.warnings);
        }

        std::string serialize() const
        {
            return _format->serialize(_table);
        }

        const table_t &table() const
        {
            return _table;
        }

        const codec::format_t &format() const
        {
            return *_format;
        }
    private:
        codec::format_ptr_t _format;
        table_t _table {};
    };

    store_t::store_t(codec::format_ptr_t format):
        _impl { std::make_unique<impl>(std::move(format)) }
    {
    }

    store_t::store_t(store_t &&) noexcept =default;
    store_t &store_t::operator=(store_t &&) noexcept =default;
    store_t::~store_t() =default;

    void store_t::set_property(const std::string_view key, const std::string_view value)
    {
        validate_key(key);
        validate_value(key, value);
        _impl->set(key, std::string { value });
    }

    void store_t::set_property_slice(const std::string_view key, const string_list_t &values)
    {
        validate_key(key);
        for (const auto &v: values)
            validate_value(key, v);
        _impl->set(key, values);
    }

    std::optional<std::string> store_t::property(const std::string_view key) const
    {
        return _impl->get<std::string>(key);
    }

    std::optional<string_list_t> store_t::property_slice(const std::string_view key) const
    {
        return _impl->get<string_list_t>(key);
    }

    bool store_t::remove_property(const std::string_view key)
    {
        return _impl->erase(key);
    }

    std::vector<std::string> store_t::property_names() const
    {
        std::vector<std::string> names {};
        names.reserve(_impl->table().size());
        for (const auto &[k, v]: _impl->table())
            names.emplace_back(k);
        return names;
    }

    size_t store_t::size() const
    {
        return _impl->table().size();
    }

    const table_t &store_t::table() const
    {
        return _impl->table();
    }

    const codec::format_t &store_t::format() const
    {
        return _impl->format();
    }

    diagnostics_t store_t::load(std::istream &is)
    {
        if (!is) [[unlikely]]
            throw error_io { "the input stream is not readable", 0 };
        const std::string text { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad()) [[unlikely]]
            throw error_io { "failed to read properties from an input stream", 0 };
        return _impl->load(text, "an input stream");
    }

    diagnostics_t store_t::load_from_file(const std::string &path)
    {
        const auto text = file::read(path);
        return _impl->load(text, path);
    }

    void store_t::store(std::ostream &os) const
    {
        const auto text = _impl->serialize();
        os.write(text.data(), static_cast<std::streamsize>(text.size()));
        os.flush();
        if (!os) [[unlikely]]
            throw error_io { "failed to write properties to an output stream", 0 };
    }

    void store_t::store_to_file(const std::string &path) const
    {
        const auto text = _impl->serialize();
        file::write(path, text);
        logger::trace("stored {} properties to {}", _impl->table().size(), path);
    }
}
