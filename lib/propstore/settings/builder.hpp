#pragma once
/* Copyright (c) 2025 The propstore authors */

#include "store.hpp"

namespace propstore::settings {
    // Usage: auto s = builder().file_type_properties().build();
    struct builder_t {
        builder_t &file_type_properties();
        // plugs in a format implemented outside of this library
        builder_t &file_type(codec::format_ptr_t format);
        // falls back to the properties format when none was selected
        [[nodiscard]] store_t build() const;
    private:
        codec::format_ptr_t _format {};
    };

    [[nodiscard]] extern builder_t builder();
}
