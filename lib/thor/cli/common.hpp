/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CLI_COMMON_HPP
#define THOR_SDK_CLI_COMMON_HPP

#include <thor/cli.hpp>
#include <thor/facade.hpp>

namespace thor_sdk::cli::common {
    extern network_config load_network(const std::string &name);
    extern crypto::secp256k1::private_key parse_private_key(std::string_view hex, std::string_view what);
    // raw transaction bytes given as hex, with or without 0x
    extern uint8_vector parse_raw_tx(std::string_view hex);
    extern void print_tx(const transaction &tx);
}

#endif // !THOR_SDK_CLI_COMMON_HPP
