/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/common/test.hpp>
#include <thor/facade.hpp>
#include <thor/gas.hpp>
#include <thor/test-vectors.hpp>

using namespace thor_sdk;

namespace {
    const network_config &test_network()
    {
        static const network_config net { .name="test", .chain_tag=1 };
        return net;
    }

    const hash32 &best_block_id()
    {
        static const auto id = hash32::from_hex("00a1b2c3d4e5f60718293a4b5c6d7e8f00112233445566778899aabbccddeeff");
        return id;
    }

    facade::options reference_options()
    {
        facade::options opts {};
        opts.type = tx_type::legacy;
        opts.block_ref = thor_sdk::block_ref::from_hex("00000000aabbccdd");
        opts.gas_price_coef = 128;
        opts.gas = 21000;
        opts.nonce = 12345678;
        opts.clauses = test::reference_clauses();
        return opts;
    }

    transaction create(const facade::options &opts, const network_config &net=test_network())
    {
        const static_block_source blocks { best_block_id() };
        fixed_nonce_source nonces { 42 };
        return facade::create(opts, facade::context { net, blocks, nonces });
    }

    uint64_t json_uint(const json::object &obj, const std::string_view name)
    {
        return json::value_to<uint64_t>(obj.at(name));
    }

    std::string json_text(const json::object &obj, const std::string_view name)
    {
        return json::value_to<std::string>(obj.at(name));
    }
}

suite facade_suite = [] {
    "facade"_test = [] {
        "create with network defaults"_test = [] {
            facade::options opts {};
            opts.clauses = test::reference_clauses();
            const auto tx = create(opts, network_config::get("solo"));
            test_same(0xF6, tx.chain_tag);
            test_same(block_ref_from_id(best_block_id()), tx.block_ref);
            test_same(32U, tx.expiration);
            expect(tx.type() == tx_type::dynamic_fee);
            const auto &fee = std::get<dynamic_fee>(tx.fee);
            expect(fee.max_priority_fee_per_gas == 400'000);
            expect(fee.max_fee_per_gas == 400'000);
            test_same(uint64_t { 37432 }, tx.gas);
            test_same(uint64_t { 42 }, tx.nonce);
            expect(!tx.depends_on);
            expect(!tx.is_delegated());
            expect(!tx.is_signed());
            expect(!tx.id);
        };
        "create the reference transaction"_test = [] {
            const auto tx = create(reference_options());
            expect(tx == test::reference_tx());
            test_same(uint8_vector::from_hex("f8540184aabbccdd20f840df947567d83b7b8d80addcb281a71d54fc7b3364ffed82271086000000606060"
                "df947567d83b7b8d80addcb281a71d54fc7b3364ffed824e208600000060606081808252088083bc614ec0"), facade::encode(tx));
            auto opts = reference_options();
            opts.delegated = true;
            expect(create(opts) == test::reference_delegated_tx());
            opts = reference_options();
            opts.type = tx_type::dynamic_fee;
            opts.gas_price_coef.reset();
            opts.max_priority_fee_per_gas = 10000;
            opts.max_fee_per_gas = 20000;
            expect(create(opts) == test::reference_dynamic_fee_tx());
        };
        "fee shape mismatch"_test = [] {
            auto opts = reference_options();
            opts.max_fee_per_gas = 20000;
            expect(throws<field_error>([&] { create(opts); }));
            opts = reference_options();
            opts.type = tx_type::dynamic_fee;
            expect(throws<field_error>([&] { create(opts); }));
        };
        "field ranges"_test = [] {
            auto opts = reference_options();
            opts.expiration = 0;
            expect(throws<field_error>([&] { create(opts); }));
            opts.expiration = uint64_t { 1 } << 32;
            expect(throws<field_error>([&] { create(opts); }));
            opts = reference_options();
            opts.gas_price_coef = 256;
            expect(throws<field_error>([&] { create(opts); }));
            opts = reference_options();
            opts.type = tx_type::dynamic_fee;
            opts.gas_price_coef.reset();
            opts.max_fee_per_gas = cpp_int { cpp_int { 1 } << 256 };
            expect(throws<field_error>([&] { create(opts); }));
            opts.max_fee_per_gas = -1;
            expect(throws<field_error>([&] { create(opts); }));
        };
        "append clause"_test = [] {
            const auto tx = facade::sign(create(reference_options()), test::origin_key());
            expect(tx.is_signed());
            const auto res = facade::append_clause(tx, clause::transfer(test::reference_to(), 1));
            test_same(size_t { 3 }, res.clauses.size());
            test_same(uint64_t { 37432 + 16000 }, res.gas);
            test_same(intrinsic_gas(res.clauses), res.gas);
            expect(!res.is_signed());
            expect(!res.origin);
            expect(!res.id);
            test_same(size_t { 2 }, tx.clauses.size());
        };
        "sign and cast"_test = [] {
            const auto tx = facade::sign(create(reference_options()), test::origin_key());
            test_same(test::origin_address(), *tx.origin);
            expect(!tx.delegator);
            const auto raw = facade::encode(tx);
            const auto dec = facade::cast(raw);
            expect(dec == tx);
            test_same(facade::id_hex(tx), facade::id_hex(dec));
            test_same(fmt::format("0x{}", *tx.id), facade::id_hex(tx));
            test_same(facade::encode(tx, false), facade::encode(create(reference_options())));
        };
        "cast unsigned"_test = [] {
            const auto tx = create(reference_options());
            const auto dec = facade::cast(facade::encode(tx));
            expect(dec == tx);
            expect(!dec.origin);
            expect(throws<error>([&] { facade::id_hex(dec); }));
        };
        "cast rejects a bad signature length"_test = [] {
            auto tx = create(reference_options());
            tx.signature.emplace(uint8_vector(64, 0x01));
            const auto raw = tx.encode();
            expect(throws<signature_error>([&] { facade::cast(raw); }));
        };
        "two-party fee delegation"_test = [] {
            auto opts = reference_options();
            opts.delegated = true;
            const auto tx = create(opts);
            // the sender signs first and hands the encoded transaction to the gas payer
            const auto sender_signed = facade::sign(tx, test::origin_key());
            test_same(signature_size, sender_signed.signature->size());
            test_same(test::origin_address(), *sender_signed.origin);
            expect(!sender_signed.delegator);
            const auto received = facade::cast(facade::encode(sender_signed));
            test_same(test::origin_address(), *received.origin);
            const auto payer_signed = facade::co_sign(received, test::delegator_key());
            test_same(delegated_signature_size, payer_signed.signature->size());
            test_same(test::origin_address(), *payer_signed.origin);
            test_same(test::delegator_address(), *payer_signed.delegator);
            test_same(transaction_id(signing_hash(tx), test::origin_address()), *payer_signed.id);
            expect(payer_signed == facade::co_sign(tx, test::origin_key(), test::delegator_key()));
            const auto dec = facade::cast(facade::encode(payer_signed));
            expect(dec == payer_signed);
            test_same(test::delegator_address(), *dec.delegator);
        };
        "co-sign by the gas payer needs the sender signature"_test = [] {
            auto opts = reference_options();
            opts.delegated = true;
            const auto tx = create(opts);
            expect(throws<signature_error>([&] { facade::co_sign(tx, test::delegator_key()); }));
            const auto both = facade::co_sign(tx, test::origin_key(), test::delegator_key());
            expect(throws<signature_error>([&] { facade::co_sign(both, test::delegator_key()); }));
            const auto not_delegated = facade::sign(create(reference_options()), test::origin_key());
            expect(throws<signature_error>([&] { facade::co_sign(not_delegated, test::delegator_key()); }));
            // a sender signature attached without recovering the origin
            auto raw_signed = tx;
            raw_signed.signature.emplace(static_cast<buffer>(origin_signature(tx, test::origin_key())));
            test_same(test::delegator_address(), *facade::co_sign(raw_signed, test::delegator_key()).delegator);
        };
        "dynamic-fee with network defaults"_test = [] {
            facade::options opts {};
            opts.clauses = test::reference_clauses();
            const auto tx = create(opts, network_config::get("solo"));
            expect(tx.type() == tx_type::dynamic_fee);
            const auto unsigned_raw = facade::encode(tx);
            test_same(size_t { dynamic_fee_prefix }, size_t { unsigned_raw.at(0) });
            const auto unsigned_dec = facade::cast(unsigned_raw);
            expect(unsigned_dec == tx);
            expect(!unsigned_dec.is_signed());
            const auto signed_tx = facade::sign(tx, test::origin_key());
            const auto signed_dec = facade::cast(facade::encode(signed_tx));
            expect(signed_dec == signed_tx);
            test_same(test::origin_address(), *signed_dec.origin);
            test_same(facade::id_hex(signed_tx), facade::id_hex(signed_dec));
            test_same(unsigned_raw, facade::encode(signed_dec, false));
        };
        "dynamic-fee fee delegation"_test = [] {
            facade::options opts {};
            opts.clauses = test::reference_clauses();
            opts.delegated = true;
            const auto tx = create(opts, network_config::get("solo"));
            const auto sender_signed = facade::cast(facade::encode(facade::sign(tx, test::origin_key())));
            expect(sender_signed.type() == tx_type::dynamic_fee);
            test_same(test::origin_address(), *sender_signed.origin);
            const auto payer_signed = facade::co_sign(sender_signed, test::delegator_key());
            const auto dec = facade::cast(facade::encode(payer_signed));
            expect(dec == payer_signed);
            test_same(test::origin_address(), *dec.origin);
            test_same(test::delegator_address(), *dec.delegator);
            test_same(delegated_signature_size, dec.signature->size());
        };
        "setters drop a stale signature"_test = [] {
            const auto tx = facade::sign(create(reference_options()), test::origin_key());
            const auto check_unsigned = [&](const transaction &res) {
                expect(!res.is_signed());
                expect(!res.origin);
                expect(!res.id);
                expect(res != tx);
                // the copy signs again under its own signing hash
                const auto resigned = facade::sign(res, test::origin_key());
                expect(*resigned.id != *tx.id);
                expect(facade::cast(facade::encode(resigned)) == resigned);
            };
            check_unsigned(facade::put_gas(tx, 50000));
            test_same(uint64_t { 50000 }, facade::put_gas(tx, 50000).gas);
            check_unsigned(facade::put_nonce(tx, 7));
            check_unsigned(facade::put_chain_tag(tx, 0x27));
            check_unsigned(facade::put_block_ref(tx, thor_sdk::block_ref::from_hex("0000000011223344")));
            check_unsigned(facade::put_expiration(tx, 720));
            check_unsigned(facade::put_depends_on(tx, hash32::from_hex("1111111111111111111111111111111111111111111111111111111111111111")));
            check_unsigned(facade::put_delegation(tx, true));
            expect(facade::put_delegation(tx, true).is_delegated());
            check_unsigned(facade::put_fee(tx, legacy_fee { 1 }));
            const auto dyn = facade::put_fee(tx, dynamic_fee { 10000, 20000 });
            expect(dyn.type() == tx_type::dynamic_fee);
            test_same(uint64_t { 21000 }, dyn.gas);
            expect(throws<field_error>([&] { facade::put_fee(tx, dynamic_fee { 0, cpp_int { cpp_int { 1 } << 256 } }); }));
            expect(throws<field_error>([&] { facade::put_expiration(tx, 0); }));
            test_same(uint64_t { 21000 }, tx.gas);
            expect(tx.is_signed());
        };
        "co-sign"_test = [] {
            auto opts = reference_options();
            opts.delegated = true;
            const auto tx = create(opts);
            const auto signed_tx = facade::co_sign(tx, test::origin_key(), test::delegator_key());
            test_same(delegated_signature_size, signed_tx.signature->size());
            test_same(test::origin_address(), *signed_tx.origin);
            test_same(test::delegator_address(), *signed_tx.delegator);
            test_same(transaction_id(signing_hash(tx), test::origin_address()), *signed_tx.id);
            const auto dec = facade::cast(facade::encode(signed_tx));
            expect(dec == signed_tx);
            test_same(test::delegator_address(), *dec.delegator);
            expect(throws<signature_error>([] { facade::co_sign(create(reference_options()), test::origin_key(), test::delegator_key()); }));
        };
        "with signatures"_test = [] {
            auto opts = reference_options();
            opts.delegated = true;
            const auto tx = create(opts);
            const auto origin_sig = origin_signature(tx, test::origin_key());
            const auto delegator_sig = delegator_signature(tx, test::origin_address(), test::delegator_key());
            const auto res = facade::with_signatures(tx, origin_sig, delegator_sig);
            expect(res == facade::co_sign(tx, test::origin_key(), test::delegator_key()));
            const uint8_vector short_sig(64);
            expect(throws<signature_error>([&] { facade::with_signatures(tx, short_sig, delegator_sig); }));
            expect(throws<signature_error>([&] { facade::with_signatures(tx, origin_sig, short_sig); }));
        };
        "to json"_test = [] {
            const auto tx = facade::sign(create(reference_options()), test::origin_key());
            const auto j = facade::to_json(tx);
            test_same(facade::id_hex(tx), json_text(j, "id"));
            test_same(std::string { "legacy" }, json_text(j, "type"));
            test_same(uint64_t { 1 }, json_uint(j, "chainTag"));
            test_same(std::string { "0x00000000aabbccdd" }, json_text(j, "blockRef"));
            test_same(uint64_t { 32 }, json_uint(j, "expiration"));
            test_same(uint64_t { 128 }, json_uint(j, "gasPriceCoef"));
            expect(!j.contains("maxFeePerGas"));
            test_same(uint64_t { 21000 }, json_uint(j, "gas"));
            test_same(uint64_t { 37432 }, json_uint(j, "intrinsicGas"));
            expect(j.at("dependsOn").is_null());
            test_same(uint64_t { 12345678 }, json_uint(j, "nonce"));
            expect(!j.at("delegated").as_bool());
            test_same(to_checksum(test::origin_address()), json_text(j, "origin"));
            expect(j.at("delegator").is_null());
            test_same(uint64_t { tx.encode().size() }, json_uint(j, "size"));
            const auto &clauses = j.at("clauses").as_array();
            test_same(size_t { 2 }, clauses.size());
            const auto &c0 = clauses.at(0).as_object();
            test_same(to_checksum(test::reference_to()), json_text(c0, "to"));
            test_same(std::string { "10000" }, json_text(c0, "value"));
            test_same(std::string { "0x000000606060" }, json_text(c0, "data"));
        };
        "options from json"_test = [] {
            const auto req = json::parse(std::string_view { R"({
                "type": "legacy",
                "blockRef": "0x00000000aabbccdd",
                "gasPriceCoef": 128,
                "gas": 21000,
                "nonce": "12345678",
                "dependsOn": null,
                "delegated": false,
                "clauses": [
                    { "to": "0x7567d83b7b8d80addcb281a71d54fc7b3364ffed", "value": "10000", "data": "0x000000606060" },
                    { "to": "0x7567D83B7B8D80ADDCB281A71D54FC7B3364FFED", "value": 20000, "data": "0x000000606060" }
                ]
            })" });
            const auto opts = facade::options::from_json(req);
            expect(opts.type == tx_type::legacy);
            expect(!opts.expiration);
            expect(!opts.depends_on);
            expect(create(opts) == test::reference_tx());
        };
        "options from json errors"_test = [] {
            const auto parse_opts = [](const std::string_view text) {
                return facade::options::from_json(json::parse(text));
            };
            expect(throws<field_error>([&] { parse_opts("[]"); }));
            expect(throws<error>([&] { parse_opts(R"({ "type": "eip1559" })"); }));
            expect(throws<field_error>([&] { parse_opts(R"({ "blockRef": "0xaabbccdd" })"); }));
            expect(throws<field_error>([&] { parse_opts(R"({ "gas": -1 })"); }));
            expect(throws<field_error>([&] { parse_opts(R"({ "delegated": "yes" })"); }));
            expect(throws<field_error>([&] { parse_opts(R"({ "clauses": {} })"); }));
            expect(throws<field_error>([&] { parse_opts(R"({ "clauses": [ { "to": "0x1234", "value": "1" } ] })"); }));
            expect(throws<clause_error>([&] { parse_opts(R"({ "clauses": [ { "to": null, "value": "1" } ] })"); }));
            const auto deploy = parse_opts(R"({ "clauses": [ { "data": "0x6060" } ] })");
            test_same(size_t { 1 }, deploy.clauses.size());
            expect(deploy.clauses.at(0).is_contract_creation());
        };
    };
};
