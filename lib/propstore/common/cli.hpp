#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace propstore::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct arg_config {
        // "<name>" is required, "[<name>]" is optional, "..." allows any number of trailing arguments
        void expect(std::initializer_list<std::string> names);
        void validate(const arguments &args) const;

        const std::vector<std::string> &names() const noexcept
        {
            return _names;
        }
    private:
        std::vector<std::string> _names {};
        size_t _min = 0;
        std::optional<size_t> _max {};
    };

    struct option_config {
        std::string desc;
        std::optional<std::string> default_value {};

        option_config(std::string d, std::optional<std::string> def = {}):
            desc { std::move(d) },
            default_value { std::move(def) }
        {
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        arg_config args {};
        std::map<std::string, option_config> opts {};

        std::string usage() const;
    };

    struct command {
        using command_map = std::map<std::string, std::shared_ptr<command>>;

        static command_map &registry();
        static std::shared_ptr<command> reg(std::shared_ptr<command> cmd);

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("command must override one of its run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    // Splits "--name" and "--name=value" options from the positional arguments
    extern std::pair<arguments, options> parse_args(const config &cfg, const std::vector<std::string> &raw);
    extern int run(int argc, const char **argv, const command::command_map &cmds);
    extern int run(int argc, const char **argv);
}
