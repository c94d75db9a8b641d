/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>

namespace thor_sdk::cli::address_info {
    struct cmd: command {
        void configure(command_config &cmd) const override
        {
            cmd.name = "address";
            cmd.desc = "show the checksummed address of a private key";
            cmd.args = { "<private-key-hex>" };
        }

        void run(const arguments &args, const options &) const override
        {
            const auto key = common::parse_private_key(args.at(0), "private");
            std::cout << to_checksum(address_from_private_key(key)) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
