/* Copyright (c) 2025 The propstore authors */

#include "properties.hpp"

namespace propstore::codec::properties {
    static bool is_space(const char c)
    {
        return c == ' ' || c == '\t' || c == '\f' || c == '\v';
    }

    static bool is_escaped_char(const char c)
    {
        return c == ',' || c == '\\';
    }

    static std::string unescape(const std::string_view s)
    {
        std::string res {};
        res.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\\' && i + 1 < s.size() && is_escaped_char(s[i + 1]))
                ++i;
            res += s[i];
        }
        return res;
    }

    static void check_representable(const std::string_view key, const std::string_view enc_val)
    {
        if (key.find_first_of("\r\n") != std::string_view::npos) [[unlikely]]
            throw err_unrepresentable_t { "properties", key, "the key contains a line break" };
        if (key.find('=') != std::string_view::npos) [[unlikely]]
            throw err_unrepresentable_t { "properties", key, "the key contains '='" };
        if (enc_val.find_first_of("\r\n") != std::string_view::npos) [[unlikely]]
            throw err_unrepresentable_t { "properties", key, "the value contains a line break" };
    }

    std::string_view trim(std::string_view s)
    {
        while (!s.empty() && is_space(s.front()))
            s.remove_prefix(1);
        while (!s.empty() && is_space(s.back()))
            s.remove_suffix(1);
        return s;
    }

    bool is_comment(const std::string_view trimmed_line)
    {
        return !trimmed_line.empty() && (trimmed_line.front() == '#' || trimmed_line.front() == '!');
    }

    std::string escape(const std::string_view s)
    {
        std::string res {};
        res.reserve(s.size());
        for (const auto c: s) {
            if (is_escaped_char(c))
                res += '\\';
            res += c;
        }
        return res;
    }

    value_t decode_value(const std::string_view raw)
    {
        std::vector<std::string_view> segments {};
        size_t seg_start = 0;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 1 < raw.size() && is_escaped_char(raw[i + 1])) {
                ++i;
            } else if (raw[i] == ',') {
                segments.emplace_back(raw.substr(seg_start, i - seg_start));
                seg_start = i + 1;
            }
        }
        if (segments.empty())
            return unescape(raw);
        segments.emplace_back(raw.substr(seg_start));
        string_list_t items {};
        items.reserve(segments.size());
        for (const auto seg: segments)
            items.emplace_back(unescape(trim(seg)));
        return items;
    }

    std::string encode_value(const value_t &val)
    {
        if (const auto *s = std::get_if<std::string>(&val))
            return escape(*s);
        const auto &items = std::get<string_list_t>(val);
        std::string res {};
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0)
                res += ',';
            res += escape(items[i]);
        }
        return res;
    }

    std::string_view format_t::name() const
    {
        return "properties";
    }

    parse_result_t format_t::parse(const std::string_view text) const
    {
        parse_result_t res {};
        diagnostics_t issues {};
        std::map<std::string, size_t, std::less<>> key_lines {};
        size_t line_no = 0;
        // "\n", "\r\n" and a lone "\r" all end a line
        for (size_t pos = 0; pos < text.size(); ) {
            auto end = text.find_first_of("\r\n", pos);
            if (end == std::string_view::npos)
                end = text.size();
            const auto line = trim(text.substr(pos, end - pos));
            pos = end + 1;
            if (end + 1 < text.size() && text[end] == '\r' && text[end + 1] == '\n')
                ++pos;
            ++line_no;
            if (line.empty() || is_comment(line))
                continue;
            const auto eq_pos = line.find('=');
            if (eq_pos == std::string_view::npos) {
                issues.push_back(diagnostic_t { line_no, fmt::format("missing the '=' separator: '{}'", line) });
                continue;
            }
            const auto key = trim(line.substr(0, eq_pos));
            if (key.empty()) {
                issues.push_back(diagnostic_t { line_no, fmt::format("an empty key: '{}'", line) });
                continue;
            }
            auto val = decode_value(trim(line.substr(eq_pos + 1)));
            if (const auto [it, created] = key_lines.try_emplace(std::string { key }, line_no); !created) {
                res.warnings.push_back(diagnostic_t { line_no,
                    fmt::format("key '{}' was already set at line {}, the later value wins", key, it->second) });
                it->second = line_no;
            }
            res.table.insert_or_assign(std::string { key }, std::move(val));
        }
        if (!issues.empty())
            throw err_parse_t { std::move(issues) };
        return res;
    }

    std::string format_t::serialize(const table_t &table) const
    {
        std::string res {};
        for (const auto &[key, val]: table) {
            const auto enc_val = encode_value(val);
            check_representable(key, enc_val);
            res += key;
            res += " = ";
            res += enc_val;
            res += '\n';
        }
        return res;
    }
}
