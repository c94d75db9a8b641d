/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <thor/crypto/random.hpp>
#include <thor/logger.hpp>
#include <thor/narrow-cast.hpp>
#include <thor/network.hpp>

namespace thor_sdk {
    namespace {
        const std::array<network_config, 3> &builtin_networks()
        {
            static const std::array<network_config, 3> nets {
                network_config { .name="mainnet", .chain_tag=0x4A, .default_node="https://mainnet.veblocks.net" },
                network_config { .name="testnet", .chain_tag=0x27, .default_node="https://testnet.veblocks.net" },
                network_config { .name="solo", .chain_tag=0xF6, .default_node="http://localhost:8669" }
            };
            return nets;
        }

        const network_config *find_builtin(const std::string_view name)
        {
            for (const auto &net: builtin_networks()) {
                if (net.name == name)
                    return &net;
            }
            return nullptr;
        }

        template<typename T>
        T uint_item(const config &cfg, const std::string_view name)
        {
            const auto &jv = cfg.at(name);
            if (jv.is_uint64())
                return narrow_cast<T>(jv.get_uint64());
            if (jv.is_int64())
                return narrow_cast<T>(jv.get_int64());
            throw error(fmt::format("network config item {} must be a non-negative integer", name));
        }

        // large fee values may be given as decimal or 0x-prefixed text
        cpp_int big_int_item(const config &cfg, const std::string_view name)
        {
            const auto &jv = cfg.at(name);
            if (jv.is_string())
                return big_int_from_string(json::value_to<std::string>(jv));
            if (jv.is_uint64())
                return cpp_int { jv.get_uint64() };
            if (jv.is_int64() && jv.get_int64() >= 0)
                return cpp_int { jv.get_int64() };
            throw error(fmt::format("network config item {} must be a non-negative integer or an integer string", name));
        }
    }

    const network_config &network_config::get(const std::string_view name)
    {
        if (const auto *net = find_builtin(name); net)
            return *net;
        throw error(fmt::format("unknown network: '{}'", name));
    }

    network_config network_config::from_config(const std::string &name, const config &cfg)
    {
        network_config net {};
        if (const auto *builtin = find_builtin(name); builtin)
            net = *builtin;
        net.name = name;
        if (cfg.find("chain_tag"))
            net.chain_tag = uint_item<uint8_t>(cfg, "chain_tag");
        else if (!find_builtin(name))
            throw error(fmt::format("network config {} does not define chain_tag", name));
        if (cfg.find("default_node"))
            net.default_node = json::value_to<std::string>(cfg.at("default_node"));
        if (cfg.find("expiration"))
            net.expiration = uint_item<uint32_t>(cfg, "expiration");
        if (cfg.find("gas_price_coef"))
            net.gas_price_coef = uint_item<uint8_t>(cfg, "gas_price_coef");
        if (cfg.find("max_priority_fee_per_gas"))
            net.max_priority_fee_per_gas = big_int_item(cfg, "max_priority_fee_per_gas");
        if (cfg.find("max_fee_per_gas"))
            net.max_fee_per_gas = big_int_item(cfg, "max_fee_per_gas");
        if (cfg.find("tx_type"))
            net.type = tx_type_from_name(json::value_to<std::string>(cfg.at("tx_type")));
        if (net.expiration == 0)
            throw error(fmt::format("network config {}: expiration must be greater than zero", name));
        logger::debug("network {}: chain tag 0x{:02x} default tx type {}", net.name, net.chain_tag, net.type);
        return net;
    }

    network_config network_config::load(const std::string &name, const configs &cfgs)
    {
        return from_config(name, cfgs.at(name));
    }

    uint64_t random_nonce_source::_next_impl()
    {
        std::array<uint8_t, sizeof(uint64_t)> bytes {};
        crypto::random_bytes(bytes);
        uint64_t nonce = 0;
        for (const auto b: bytes)
            nonce = (nonce << 8) | b;
        return nonce;
    }
}
