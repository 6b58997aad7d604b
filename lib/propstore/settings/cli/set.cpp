/* Copyright (c) 2025 The propstore authors */

#include <ranges>
#include "common.hpp"

namespace propstore::cli::prop_set {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prop-set";
            cmd.desc = "Set <key> in the properties file <file>, creating the file if necessary; two or more values make a list";
            cmd.args.expect({"<file>", "<key>", "<value>", "[<value> ...]"});
            cmd.opts.try_emplace("list", "Store a single <value> as a list");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto &key = args.at(1);
            auto s = settings_common::open_store(path, false);
            if (args.size() > 3 || opts.at("list")) {
                settings::string_list_t values {};
                for (const auto &v: args | std::views::drop(2))
                    values.emplace_back(v);
                s.set_property_slice(key, values);
            } else {
                s.set_property(key, args.at(2));
            }
            s.store_to_file(path);
            logger::info("{}: {} = {}", path, key, s.table().at(key));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
