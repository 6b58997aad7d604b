/* Copyright (c) 2025 The propstore authors */

#include "test.hpp"
#include "cli.hpp"

namespace {
    using namespace propstore;
    using namespace propstore::cli;

    struct echo_cmd: command {
        mutable arguments last_args {};
        mutable options last_opts {};

        void configure(config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "Remember <a> and optional <b>";
            cmd.args.expect({"<a>", "[<b>]"});
            cmd.opts.try_emplace("mode", "A mode with a default", "fast");
            cmd.opts.try_emplace("flag", "A flag without a default");
        }

        void run(const arguments &args, const options &opts) const override
        {
            if (args.at(0) == "fail")
                throw error("asked to fail");
            last_args = args;
            last_opts = opts;
        }
    };

    config echo_config()
    {
        config cfg {};
        echo_cmd {}.configure(cfg);
        return cfg;
    }
}

suite propstore_common_cli_suite = [] {
    "propstore::common::cli"_test = [] {
        "parse_args"_test = [] {
            const auto cfg = echo_config();
            const auto [args, opts] = parse_args(cfg, { "x", "--mode=slow", "y", "--flag" });
            expect_equal(arguments { "x", "y" }, args);
            expect_equal(std::optional<std::string> { "slow" }, opts.at("mode"));
            expect_equal(std::optional<std::string> { "" }, opts.at("flag"));
        };
        "defaults"_test = [] {
            const auto [args, opts] = parse_args(echo_config(), { "x" });
            expect_equal(std::optional<std::string> { "fast" }, opts.at("mode"));
            expect_equal(std::optional<std::string> {}, opts.at("flag"));
        };
        "argument counts"_test = [] {
            const auto cfg = echo_config();
            expect(throws<error>([&] { (void)parse_args(cfg, {}); }));
            expect(throws<error>([&] { (void)parse_args(cfg, { "a", "b", "c" }); }));
            expect(throws<error>([&] { (void)parse_args(cfg, { "a", "--unknown" }); }));
        };
        "variadic arguments"_test = [] {
            config cfg {};
            cfg.name = "many";
            cfg.args.expect({"<first>", "[<rest> ...]"});
            expect_equal(size_t { 5 }, parse_args(cfg, { "1", "2", "3", "4", "5" }).first.size());
            expect(throws<error>([&] { (void)parse_args(cfg, {}); }));
        };
        "usage"_test = [] {
            expect_equal(std::string { "echo <a> [<b>] [--flag] [--mode=fast]" }, echo_config().usage());
        };
        "run"_test = [] {
            const auto cmd = std::make_shared<echo_cmd>();
            const command::command_map cmds { { "echo", cmd } };
            const char *ok_argv[] = { "propstore", "echo", "1", "--flag=on" };
            expect_equal(0, cli::run(4, ok_argv, cmds));
            expect_equal(arguments { "1" }, cmd->last_args);
            expect_equal(std::optional<std::string> { "on" }, cmd->last_opts.at("flag"));
            const char *fail_argv[] = { "propstore", "echo", "fail" };
            expect_equal(1, cli::run(3, fail_argv, cmds));
            const char *unknown_argv[] = { "propstore", "unknown" };
            expect_equal(1, cli::run(2, unknown_argv, cmds));
            const char *usage_argv[] = { "propstore" };
            expect_equal(1, cli::run(1, usage_argv, cmds));
        };
        "registration"_test = [] {
            const auto cmd = std::make_shared<echo_cmd>();
            expect(!command::registry().contains("echo"));
            expect(command::reg(cmd) == cmd);
            expect(command::registry().contains("echo"));
            expect(throws<error>([&] { command::reg(cmd); }));
        };
    };
};
