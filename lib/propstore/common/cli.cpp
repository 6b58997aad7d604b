/* Copyright (c) 2025 The propstore authors */

#include <algorithm>
#include "cli.hpp"

namespace propstore::cli {
    void arg_config::expect(const std::initializer_list<std::string> names)
    {
        _names = names;
        _min = static_cast<size_t>(std::count_if(_names.begin(), _names.end(), [](const auto &n) { return !n.starts_with('['); }));
        if (std::any_of(_names.begin(), _names.end(), [](const auto &n) { return n.find("...") != std::string::npos; }))
            _max.reset();
        else
            _max = _names.size();
    }

    void arg_config::validate(const arguments &args) const
    {
        if (args.size() < _min) [[unlikely]]
            throw error(fmt::format("expected at least {} argument(s) but got {}", _min, args.size()));
        if (_max && args.size() > *_max) [[unlikely]]
            throw error(fmt::format("expected at most {} argument(s) but got {}", *_max, args.size()));
    }

    std::string config::usage() const
    {
        std::string res = name;
        for (const auto &arg: args.names())
            res += fmt::format(" {}", arg);
        for (const auto &[opt_name, opt]: opts) {
            if (opt.default_value)
                res += fmt::format(" [--{}={}]", opt_name, *opt.default_value);
            else
                res += fmt::format(" [--{}]", opt_name);
        }
        return res;
    }

    command::command_map &command::registry()
    {
        static command_map cmds {};
        return cmds;
    }

    std::shared_ptr<command> command::reg(std::shared_ptr<command> cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        if (const auto [it, created] = registry().try_emplace(cfg.name, cmd); !created) [[unlikely]]
            throw error(fmt::format("a duplicate registration for the command {}", cfg.name));
        return cmd;
    }

    std::pair<arguments, options> parse_args(const config &cfg, const std::vector<std::string> &raw)
    {
        arguments args {};
        options opts {};
        for (const auto &a: raw) {
            if (!a.starts_with("--")) {
                args.emplace_back(a);
                continue;
            }
            const auto eq_pos = a.find('=');
            auto opt_name = a.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            if (!cfg.opts.contains(opt_name)) [[unlikely]]
                throw error(fmt::format("command {} does not support option --{}", cfg.name, opt_name));
            opts.insert_or_assign(std::move(opt_name), eq_pos == std::string::npos ? std::string {} : a.substr(eq_pos + 1));
        }
        for (const auto &[opt_name, opt]: cfg.opts) {
            opts.try_emplace(opt_name, opt.default_value);
        }
        cfg.args.validate(args);
        return { std::move(args), std::move(opts) };
    }

    static void print_usage(const command::command_map &cmds)
    {
        logger::info("usage: propstore <command> [<arg> ...] [--<option>[=<value>] ...]");
        logger::info("commands:");
        for (const auto &[name, cmd]: cmds) {
            config cfg {};
            cmd->configure(cfg);
            logger::info("  {}: {}", cfg.usage(), cfg.desc);
        }
    }

    int run(const int argc, const char **argv, const command::command_map &cmds)
    {
        if (argc < 2) {
            print_usage(cmds);
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto cmd_it = cmds.find(cmd_name);
        if (cmd_it == cmds.end()) {
            logger::error("unknown command: {}", cmd_name);
            print_usage(cmds);
            return 1;
        }
        const auto ex = logger::run_log_errors([&] {
            config cfg {};
            cmd_it->second->configure(cfg);
            const auto [args, opts] = parse_args(cfg, std::vector<std::string>(argv + 2, argv + argc));
            logger::debug("running command {} with {} argument(s)", cfg.name, args.size());
            cmd_it->second->run(args, opts);
        });
        return ex ? 1 : 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
