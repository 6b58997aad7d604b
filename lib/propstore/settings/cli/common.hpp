#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <filesystem>
#include <propstore/common/cli.hpp>
#include <propstore/common/logger.hpp>
#include <propstore/settings/builder.hpp>

namespace propstore::cli::settings_common {
    // A missing file is treated as an empty table unless must_exist is set
    inline settings::store_t open_store(const std::string &path, const bool must_exist=true)
    {
        auto s = settings::builder().file_type_properties().build();
        if (must_exist || std::filesystem::exists(path)) {
            for (const auto &w: s.load_from_file(path))
                logger::warn("{}: {}", path, w);
        }
        return s;
    }
}
