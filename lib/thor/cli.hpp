/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CLI_HPP
#define THOR_SDK_CLI_HPP

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <thor/config.hpp>
#include <thor/logger.hpp>

namespace thor_sdk::cli {
    using arguments = std::vector<std::string>;
    // --name and --name=value, the former maps to an empty optional
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
    };
    using option_config_map = std::map<std::string, option_config>;

    struct command_config {
        std::string name {};
        std::string desc {};
        // positional arguments are all required
        std::vector<std::string> args {};
        option_config_map opts {};

        std::string make_usage() const;
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    inline std::optional<std::string> option_value(const options &opts, const std::string &name)
    {
        if (const auto it = opts.find(name); it != opts.end())
            return it->second;
        return {};
    }

    // Commands register themselves from static initializers in their translation units
    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(command_config &cfg) const =0;
        virtual void run(const arguments &args, const options &opts) const =0;

        parse_result parse(const command_config &cfg, const arguments &args) const;
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        command_config cfg {};
    };

    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !THOR_SDK_CLI_HPP
