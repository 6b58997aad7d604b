/* Copyright (c) 2025 The propstore authors */

#include "common.hpp"

namespace propstore::cli::prop_remove {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prop-remove";
            cmd.desc = "Remove <key> from the properties file <file>";
            cmd.args.expect({"<file>", "<key>"});
        }

        void run(const arguments &args) const override
        {
            const auto &path = args.at(0);
            const auto &key = args.at(1);
            auto s = settings_common::open_store(path);
            if (!s.remove_property(key)) [[unlikely]]
                throw error(fmt::format("{}: no property with the key '{}'", path, key));
            s.store_to_file(path);
            logger::info("{}: removed {}, {} properties left", path, key, s.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
