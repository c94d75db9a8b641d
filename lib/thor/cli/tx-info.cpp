/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>

namespace thor_sdk::cli::tx_info {
    struct cmd: command {
        void configure(command_config &cmd) const override
        {
            cmd.name = "tx-info";
            cmd.desc = "decode a raw transaction and show its fields, signers and id";
            cmd.args = { "<raw-tx-hex>" };
        }

        void run(const arguments &args, const options &) const override
        {
            const auto tx = facade::cast(common::parse_raw_tx(args.at(0)));
            common::print_tx(tx);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
