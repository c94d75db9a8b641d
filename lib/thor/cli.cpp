/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <chrono>
#include <thor/cli.hpp>

namespace thor_sdk::cli {
    namespace {
        [[noreturn]] void throw_usage(const command_config &cfg)
        {
            std::string usage = fmt::format("usage: {} {}", cfg.name, cfg.make_usage());
            if (!cfg.opts.empty()) {
                usage += fmt::format("\n{} supports the following options:", cfg.name);
                for (const auto &[name, opt]: cfg.opts)
                    usage += fmt::format("\n    --{} - {}", name, opt.desc);
            }
            throw error(usage);
        }
    }

    std::string command_config::make_usage() const
    {
        std::string arg_info {};
        for (const auto &a: args)
            arg_info += fmt::format(" {}", a);
        return fmt::format("{}{} - {}", opts.empty() ? "" : "[options]", arg_info, desc);
    }

    parse_result command::parse(const command_config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                pr.args.emplace_back(arg);
                continue;
            }
            std::string name = arg.substr(2);
            std::optional<std::string> val {};
            if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                val = arg.substr(eq_pos + 1);
                name = arg.substr(2, eq_pos - 2);
            }
            if (!cfg.opts.contains(name))
                throw error(fmt::format("unknown option '--{}'", name));
            if (const auto [it, created] = pr.opts.try_emplace(name, std::move(val)); !created)
                throw error(fmt::format("duplicate option '{}'", arg));
        }
        if (pr.args.size() != cfg.args.size())
            throw_usage(cfg);
        if (const auto dir = option_value(pr.opts, "config-dir"); dir)
            configs_dir::set_default_path(*dir);
        return pr;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            meta.cfg.opts.try_emplace("config-dir", option_config { "a directory with network configuration files" });
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: thor <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {} {}\n", name, meta.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &meta = cmd_it->second;
            const auto start = std::chrono::steady_clock::now();
            const auto pr = meta.cmd->parse(meta.cfg, args);
            meta.cmd->run(pr.args, pr.opts);
            const std::chrono::duration<double> took = std::chrono::steady_clock::now() - start;
            logger::debug("{} took {:.3f} sec", cmd, took.count());
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
