#pragma once
/* Copyright (c) 2025 The propstore authors */

#include "format.hpp"

namespace propstore::codec::properties {
    /*
     * The line-oriented "key = value" format:
     * 1) lines end with "\n", "\r\n" or a lone "\r";
     * 2) lines starting with '#' or '!' after optional whitespace are comments, blank lines are skipped;
     * 3) only the first '=' separates a key from its value, both sides are trimmed;
     * 4) an unescaped ',' turns the value into a list, its segments are trimmed;
     * 5) "\," is a literal comma and "\\" a literal backslash, any other backslash is kept as is.
     */
    struct format_t: codec::format_t {
        [[nodiscard]] std::string_view name() const override;
        [[nodiscard]] parse_result_t parse(std::string_view text) const override;
        [[nodiscard]] std::string serialize(const table_t &table) const override;
    };

    extern std::string_view trim(std::string_view s);
    extern bool is_comment(std::string_view trimmed_line);
    extern std::string escape(std::string_view s);
    // Splits a raw value on unescaped commas and unescapes the result
    extern value_t decode_value(std::string_view raw);
    extern std::string encode_value(const value_t &val);
}
