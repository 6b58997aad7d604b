#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <string>
#include <string_view>
#include <propstore/common/error.hpp>
#include <propstore/common/format.hpp>

namespace propstore::settings {
    struct err_invalid_key_t final: error {
        err_invalid_key_t(const std::string_view key, const std::string_view reason):
            error { fmt::format("invalid key '{}': {}", key, reason) },
            _key { key }
        {
        }

        const std::string &key() const noexcept
        {
            return _key;
        }
    private:
        std::string _key;
    };

    struct err_invalid_value_t final: error {
        err_invalid_value_t(const std::string_view key, const std::string_view reason):
            error { fmt::format("invalid value for key '{}': {}", key, reason) },
            _key { key }
        {
        }

        const std::string &key() const noexcept
        {
            return _key;
        }
    private:
        std::string _key;
    };
}
