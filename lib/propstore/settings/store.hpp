#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <iosfwd>
#include <memory>
#include <optional>
#include <propstore/codec/format.hpp>
#include "errors.hpp"

namespace propstore::settings {
    using codec::string_list_t;
    using codec::value_t;
    using codec::table_t;
    using codec::diagnostics_t;

    // An in-memory table of properties bound to a single format.
    // Not synchronized: concurrent access requires external locking.
    struct store_t {
        explicit store_t(codec::format_ptr_t format);
        store_t(store_t &&) noexcept;
        store_t &operator=(store_t &&) noexcept;
        ~store_t();

        // throw err_invalid_key_t or err_invalid_value_t and leave the table unchanged
        void set_property(std::string_view key, std::string_view value);
        void set_property_slice(std::string_view key, const string_list_t &values);

        // empty when the key is absent or holds a value of the other kind
        [[nodiscard]] std::optional<std::string> property(std::string_view key) const;
        [[nodiscard]] std::optional<string_list_t> property_slice(std::string_view key) const;

        bool remove_property(std::string_view key);
        [[nodiscard]] std::vector<std::string> property_names() const;
        [[nodiscard]] size_t size() const;
        [[nodiscard]] const table_t &table() const;
        [[nodiscard]] const codec::format_t &format() const;

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }

        // Replace the table with the parsed input; on failure the table stays as it was.
        // Return the parser's warnings.
        diagnostics_t load(std::istream &is);
        diagnostics_t load_from_file(const std::string &path);

        void store(std::ostream &os) const;
        void store_to_file(const std::string &path) const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
