/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>

namespace thor_sdk::cli::tx_sign {
    struct cmd: command {
        void configure(command_config &cmd) const override
        {
            cmd.name = "tx-sign";
            cmd.desc = "sign a raw transaction with the sender's private key";
            cmd.args = { "<raw-tx-hex>", "<private-key-hex>" };
        }

        void run(const arguments &args, const options &) const override
        {
            const auto tx = facade::cast(common::parse_raw_tx(args.at(0)));
            if (tx.is_signed())
                logger::warn("replacing the existing signature of the transaction");
            const auto key = common::parse_private_key(args.at(1), "sender");
            common::print_tx(facade::sign(tx, key));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
