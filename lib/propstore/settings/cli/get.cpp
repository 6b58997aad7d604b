/* Copyright (c) 2025 The propstore authors */

#include "common.hpp"

namespace propstore::cli::prop_get {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prop-get";
            cmd.desc = "Print the value of <key> stored in the properties file <file>";
            cmd.args.expect({"<file>", "<key>"});
        }

        void run(const arguments &args) const override
        {
            const auto &path = args.at(0);
            const auto &key = args.at(1);
            const auto s = settings_common::open_store(path);
            const auto it = s.table().find(key);
            if (it == s.table().end()) [[unlikely]]
                throw error(fmt::format("{}: no property with the key '{}'", path, key));
            logger::info("{} = {}", key, it->second);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
