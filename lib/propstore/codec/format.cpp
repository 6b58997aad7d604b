/* Copyright (c) 2025 The propstore authors */

#include "format.hpp"

namespace propstore::codec {
    err_parse_t::err_parse_t(diagnostics_t issues):
        error { fmt::format("malformed input with {} issue(s): {}", issues.size(), fmt::join(issues, "; ")) },
        _issues { std::move(issues) }
    {
    }

    err_unrepresentable_t::err_unrepresentable_t(const std::string_view format_name, const std::string_view key, const std::string_view reason):
        error { fmt::format("the {} format cannot store the key '{}': {}", format_name, key, reason) },
        _key { key }
    {
    }
}
