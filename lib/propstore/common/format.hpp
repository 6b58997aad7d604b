#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <optional>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fmt {
    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::optional<T> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };
}
