/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>

namespace thor_sdk::cli::tx_co_sign {
    struct cmd: command {
        void configure(command_config &cmd) const override
        {
            cmd.name = "tx-co-sign";
            cmd.desc = "add the gas payer's signature to a fee-delegated transaction signed by its sender with tx-sign";
            cmd.args = { "<raw-tx-hex>", "<gas-payer-key-hex>" };
        }

        void run(const arguments &args, const options &) const override
        {
            const auto tx = facade::cast(common::parse_raw_tx(args.at(0)));
            const auto delegator_key = common::parse_private_key(args.at(1), "gas payer");
            common::print_tx(facade::co_sign(tx, delegator_key));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
