/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/clause.hpp>
#include <thor/common/test.hpp>

using namespace thor_sdk;

suite clause_suite = [] {
    "clause"_test = [] {
        const auto to = address::from_hex("7567d83b7b8d80addcb281a71d54fc7b3364ffed");
        "builders"_test = [&] {
            const auto t = clause::transfer(to, 10000);
            expect(!t.is_contract_creation());
            expect(t.data.empty());
            test_same(t, clause::transfer("0x7567d83b7b8d80addcb281a71d54fc7b3364ffed", "10000"));
            test_same(t, clause::transfer("0x7567d83b7b8d80addcb281a71d54fc7b3364ffed", "0x2710"));
            const auto c = clause::call(to, 0, uint8_vector { 0xA9, 0x05, 0x9C, 0xBB });
            test_same(c, clause::call("0x7567d83b7b8d80addcb281a71d54fc7b3364ffed", "0", "0xa9059cbb"));
            const auto d = clause::deploy(uint8_vector { 0x60, 0x60 });
            expect(d.is_contract_creation());
            test_same(d, clause::deploy("0x6060"));
        };
        "deploy needs bytecode"_test = [] {
            expect(throws<clause_error>([] { clause::deploy(uint8_vector {}); }));
            expect(throws<clause_error>([] { clause::deploy("0x"); }));
            expect(throws<clause_error>([] { clause::make({}, 0, {}); }));
        };
        "value range"_test = [&] {
            expect(encode_value(0).empty());
            test_same(uint8_vector { 0x27, 0x10 }, encode_value(10000));
            const cpp_int max = (cpp_int { 1 } << 256) - 1;
            expect(encode_value(max).size() == 32U);
            expect(throws<field_error>([&] { clause::transfer(to, max + 1); }));
            expect(throws<field_error>([&] { clause::transfer(to, -1); }));
            expect(throws<field_error>([] { clause::transfer("0x7567d83b7b8d80addcb281a71d54fc7b3364ffed", "ten"); }));
        };
        "address length"_test = [] {
            expect(throws<field_error>([] { clause::transfer("0x7567d83b7b8d80addcb281a71d54fc7b3364ff", "1"); }));
            expect(throws<field_error>([] { clause::transfer("0x7567d83b7b8d80addcb281a71d54fc7b3364ffed00", "1"); }));
            expect(throws<field_error>([] { clause::call("0x7567d83b7b8d80addcb281a71d54fc7b3364ffed", "1", "a9059cbb"); }));
        };
        "encoding"_test = [&] {
            const auto c = clause::call(to, 10000, uint8_vector { 0x00, 0x00, 0x00, 0x60, 0x60, 0x60 });
            const auto enc = rlp::encode_object(c.to_value(), clause_profile());
            test_same(uint8_vector::from_hex("df947567d83b7b8d80addcb281a71d54fc7b3364ffed82271086000000606060"), enc);
            test_same(c, clause::from_value(rlp::decode_object(enc, clause_profile())));
            const auto d = clause::deploy(uint8_vector { 0x60 });
            const auto d_enc = rlp::encode_object(d.to_value(), clause_profile());
            test_same(uint8_vector::from_hex("c3808060"), d_enc);
            test_same(d, clause::from_value(rlp::decode_object(d_enc, clause_profile())));
        };
        "decoded deploy without bytecode"_test = [] {
            const auto dec = rlp::decode_object(uint8_vector::from_hex("c3808080"), clause_profile());
            expect(throws<clause_error>([&] { clause::from_value(dec, "transaction.clauses[0]"); }));
        };
        "missing field path"_test = [] {
            rlp::value_map m {};
            m.set("to", rlp::value {});
            m.set("value", rlp::value { 1 });
            std::string msg {};
            try {
                clause::from_value(rlp::value { std::move(m) }, "transaction.clauses[0]");
            } catch (const field_error &ex) {
                msg = ex.what();
            }
            test_same(std::string { "transaction.clauses[0].data: the field is missing" }, msg);
        };
    };
};
