/* Copyright (c) 2025 The propstore authors */

#include <propstore/codec/properties.hpp>
#include "builder.hpp"

namespace propstore::settings {
    builder_t &builder_t::file_type_properties()
    {
        _format = std::make_shared<codec::properties::format_t>();
        return *this;
    }

    builder_t &builder_t::file_type(codec::format_ptr_t format)
    {
        if (!format) [[unlikely]]
            throw error("file_type requires a non-null format!");
        _format = std::move(format);
        return *this;
    }

    store_t builder_t::build() const
    {
        if (_format)
            return store_t { _format };
        return store_t { std::make_shared<codec::properties::format_t>() };
    }

    builder_t builder()
    {
        return {};
    }
}
