#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <propstore/common/error.hpp>
#include <propstore/common/format.hpp>

namespace propstore::codec {
    using string_list_t = std::vector<std::string>;
    // the alternative decides whether a property is a single string or a list
    using value_t = std::variant<std::string, string_list_t>;
    using table_t = std::map<std::string, value_t, std::less<>>;

    struct diagnostic_t {
        size_t line_no = 0;
        std::string message {};

        bool operator==(const diagnostic_t &o) const =default;
    };
    using diagnostics_t = std::vector<diagnostic_t>;

    struct parse_result_t {
        table_t table {};
        // non-fatal findings such as repeated keys
        diagnostics_t warnings {};
    };

    // Thrown once per parse with every malformed line of the input
    struct err_parse_t final: error {
        explicit err_parse_t(diagnostics_t issues);

        const diagnostics_t &issues() const noexcept
        {
            return _issues;
        }
    private:
        diagnostics_t _issues;
    };

    // Thrown by serialize for a key or a value the format has no way to write
    struct err_unrepresentable_t final: error {
        err_unrepresentable_t(std::string_view format_name, std::string_view key, std::string_view reason);

        const std::string &key() const noexcept
        {
            return _key;
        }
    private:
        std::string _key;
    };

    struct format_t {
        virtual ~format_t() =default;
        [[nodiscard]] virtual std::string_view name() const =0;
        [[nodiscard]] virtual parse_result_t parse(std::string_view text) const =0;
        [[nodiscard]] virtual std::string serialize(const table_t &table) const =0;
    };
    using format_ptr_t = std::shared_ptr<const format_t>;
}

namespace fmt {
    template<>
    struct formatter<propstore::codec::value_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const propstore::codec::value_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return std::visit([&](const auto &val) {
                return fmt::format_to(ctx.out(), "{}", val);
            }, v);
        }
    };

    template<>
    struct formatter<propstore::codec::diagnostic_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const propstore::codec::diagnostic_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "line {}: {}", v.line_no, v.message);
        }
    };
}
