/* Copyright (c) 2025 The propstore authors */

#include "common.hpp"

namespace propstore::cli::prop_list {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prop-list";
            cmd.desc = "Print all properties stored in <file> in the order of their keys";
            cmd.args.expect({"<file>"});
        }

        void run(const arguments &args) const override
        {
            const auto s = settings_common::open_store(args.at(0));
            for (const auto &[key, val]: s.table())
                logger::info("{} = {}", key, val);
            logger::info("{}: {} properties", args.at(0), s.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
