/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>

namespace thor_sdk::cli::tx_create {
    struct missing_block_source: block_source {
    private:
        hash32 _best_block_id_impl() const override
        {
            throw error("the request has no blockRef and --best-block is not specified");
        }
    };

    struct cmd: command {
        void configure(command_config &cmd) const override
        {
            cmd.name = "tx-create";
            cmd.desc = "build an unsigned transaction from a JSON request";
            cmd.args = { "<network>", "<request-path>" };
            cmd.opts.try_emplace("best-block", option_config { "the id of the best block used to derive the block reference" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto net = common::load_network(args.at(0));
            const auto req = facade::options::from_json(json::load(args.at(1)));
            std::unique_ptr<block_source> blocks {};
            if (const auto best = option_value(opts, "best-block"); best)
                blocks = std::make_unique<static_block_source>(hash32::from_hex(*best));
            else
                blocks = std::make_unique<missing_block_source>();
            random_nonce_source nonces {};
            const auto tx = facade::create(req, facade::context { net, *blocks, nonces });
            common::print_tx(tx);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
