/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/common/test.hpp>
#include <thor/network.hpp>

using namespace thor_sdk;

suite network_suite = [] {
    "network"_test = [] {
        "builtin"_test = [] {
            const auto &main = network_config::get("mainnet");
            test_same(0x4A, main.chain_tag);
            test_same(std::string { "https://mainnet.veblocks.net" }, main.default_node);
            test_same(0x27, network_config::get("testnet").chain_tag);
            const auto &solo = network_config::get("solo");
            test_same(0xF6, solo.chain_tag);
            test_same(32U, solo.expiration);
            expect(solo.type == tx_type::dynamic_fee);
            expect(solo.max_fee_per_gas == 400'000);
            expect(throws<error>([] { network_config::get("devnet"); }));
        };
        "from config"_test = [] {
            configs_mock::map_type cfg_data {};
            cfg_data.emplace("custom", json::object {
                { "chain_tag", 7 },
                { "default_node", "http://127.0.0.1:8669" },
                { "expiration", 720 },
                { "gas_price_coef", 128 },
                { "max_priority_fee_per_gas", "0x2710" },
                { "max_fee_per_gas", 20000 },
                { "tx_type", "legacy" }
            });
            cfg_data.emplace("mainnet", json::object {
                { "default_node", "http://127.0.0.1:8669" }
            });
            cfg_data.emplace("no-tag", json::object {
                { "default_node", "http://127.0.0.1:8669" }
            });
            cfg_data.emplace("zero-expiration", json::object {
                { "chain_tag", 1 },
                { "expiration", 0 }
            });
            cfg_data.emplace("wide-tag", json::object {
                { "chain_tag", 256 }
            });
            cfg_data.emplace("bad-type", json::object {
                { "chain_tag", 1 },
                { "tx_type", "eip1559" }
            });
            const configs_mock cfgs { std::move(cfg_data) };
            const auto custom = network_config::load("custom", cfgs);
            test_same(std::string { "custom" }, custom.name);
            test_same(7, custom.chain_tag);
            test_same(720U, custom.expiration);
            test_same(128, custom.gas_price_coef);
            expect(custom.max_priority_fee_per_gas == 10000);
            expect(custom.max_fee_per_gas == 20000);
            expect(custom.type == tx_type::legacy);
            const auto main = network_config::load("mainnet", cfgs);
            test_same(0x4A, main.chain_tag);
            test_same(std::string { "http://127.0.0.1:8669" }, main.default_node);
            expect(throws<error>([&] { network_config::load("no-tag", cfgs); }));
            expect(throws<error>([&] { network_config::load("zero-expiration", cfgs); }));
            expect(throws<error>([&] { network_config::load("wide-tag", cfgs); }));
            expect(throws<error>([&] { network_config::load("bad-type", cfgs); }));
            expect(throws<error>([&] { network_config::load("testnet", cfgs); }));
        };
        "config files"_test = [] {
            const configs_dir cfgs { configs_dir::default_path() };
            for (const auto *name: { "mainnet", "testnet", "solo" }) {
                const auto net = network_config::load(name, cfgs);
                expect(net == network_config::get(name)) << name;
            }
        };
        "block ref"_test = [] {
            const auto id = hash32::from_hex("00a1b2c3d4e5f60718293a4b5c6d7e8f00112233445566778899aabbccddeeff");
            test_same(block_ref::from_hex("00a1b2c3d4e5f607"), block_ref_from_id(id));
            const static_block_source blocks { id };
            test_same(id, blocks.best_block_id());
        };
        "nonce"_test = [] {
            fixed_nonce_source fixed { 12345678 };
            test_same(uint64_t { 12345678 }, fixed.next());
            test_same(uint64_t { 12345678 }, fixed.next());
            random_nonce_source rnd {};
            // two equal draws of 64 random bits are not expected
            const auto a = rnd.next();
            const auto b = rnd.next();
            expect(a != b);
        };
    };
};
