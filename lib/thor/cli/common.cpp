/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli/common.hpp>

namespace thor_sdk::cli::common {
    network_config load_network(const std::string &name)
    {
        const configs_dir cfgs { configs_dir::default_path() };
        return network_config::load(name, cfgs);
    }

    crypto::secp256k1::private_key parse_private_key(const std::string_view hex, const std::string_view what)
    {
        const auto stripped = strip_hex_prefix(hex);
        if (stripped.size() != sizeof(crypto::secp256k1::private_key) * 2)
            throw error(fmt::format("the {} key must be {} hex-encoded bytes", what, sizeof(crypto::secp256k1::private_key)));
        auto key = crypto::secp256k1::private_key::from_hex(stripped);
        if (!crypto::secp256k1::valid_private_key(key))
            throw error(fmt::format("the {} key is not a valid secp256k1 private key", what));
        return key;
    }

    uint8_vector parse_raw_tx(const std::string_view hex)
    {
        const auto stripped = strip_hex_prefix(hex);
        if (stripped.empty() || stripped.size() % 2 != 0)
            throw error("the transaction must be a non-empty hex string with an even number of digits");
        return uint8_vector::from_hex(stripped);
    }

    void print_tx(const transaction &tx)
    {
        std::cout << json::serialize_pretty(facade::to_json(tx)) << '\n';
        std::cout << fmt::format("raw: {}\n", to_hex_0x(facade::encode(tx)));
    }
}
