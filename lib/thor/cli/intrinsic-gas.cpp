/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>
#include <thor/gas.hpp>

namespace thor_sdk::cli::intrinsic_gas {
    struct cmd: command {
        void configure(command_config &cmd) const override
        {
            cmd.name = "intrinsic-gas";
            cmd.desc = "compute the intrinsic gas of the clauses of a JSON request";
            cmd.args = { "<request-path>" };
        }

        void run(const arguments &args, const options &) const override
        {
            const auto req = facade::options::from_json(json::load(args.at(0)));
            for (size_t i = 0; i < req.clauses.size(); ++i)
                logger::debug("clause #{}: {}", i, req.clauses[i]);
            std::cout << thor_sdk::intrinsic_gas(req.clauses) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
