/* Copyright (c) 2025 The propstore authors */

#include "common.hpp"

namespace propstore::cli::prop_check {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prop-check";
            cmd.desc = "Report every malformed line and repeated key of the properties file <file>";
            cmd.args.expect({"<file>"});
            cmd.opts.try_emplace("normalize", "Rewrite a well-formed file in the canonical form");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            auto s = settings::builder().file_type_properties().build();
            settings::diagnostics_t warnings {};
            try {
                warnings = s.load_from_file(path);
            } catch (const codec::err_parse_t &ex) {
                for (const auto &issue: ex.issues())
                    logger::error("{}:{}: {}", path, issue.line_no, issue.message);
                throw error(fmt::format("{}: found {} malformed line(s)", path, ex.issues().size()));
            }
            for (const auto &w: warnings)
                logger::warn("{}:{}: {}", path, w.line_no, w.message);
            if (opts.at("normalize")) {
                s.store_to_file(path);
                logger::info("{}: rewritten in the canonical form", path);
            }
            logger::info("{}: {} properties, {} warning(s)", path, s.size(), warnings.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
