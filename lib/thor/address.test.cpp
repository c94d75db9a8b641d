/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/address.hpp>
#include <thor/blake2b.hpp>
#include <thor/common/test.hpp>

using namespace thor_sdk;

suite address_suite = [] {
    "address"_test = [] {
        "from private key"_test = [] {
            test_same(address::from_hex("7e5f4552091a69125d5dfcb7b8c2659029395bdf"),
                address_from_private_key(crypto::secp256k1::private_key::from_hex("0000000000000000000000000000000000000000000000000000000000000001")));
            test_same(address::from_hex("2b5ad5c4795c026514f8317c7a215e218dccd6cf"),
                address_from_private_key(crypto::secp256k1::private_key::from_hex("0000000000000000000000000000000000000000000000000000000000000002")));
        };
        "recover"_test = [] {
            const auto sk = crypto::secp256k1::private_key::from_hex("0000000000000000000000000000000000000000000000000000000000000002");
            const auto hash = blake2b_256(uint8_vector { 1, 2, 3 });
            test_same(address_from_private_key(sk), recover_address(hash, crypto::secp256k1::sign(hash, sk)));
        };
        "parse"_test = [] {
            const auto a = parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
            test_same(a, parse_address("7E5F4552091A69125D5DFCB7B8C2659029395BDF"));
            expect(throws<field_error>([] { parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395b"); }));
            expect(throws<field_error>([] { parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf00"); }));
            expect(throws<field_error>([] { parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bzz"); }));
            expect(is_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
            expect(!is_address("7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
        };
        "checksum"_test = [] {
            for (const std::string_view exp: {
                "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
                "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
                "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
                "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb"
            }) {
                test_same(std::string { exp }, to_checksum(parse_address(exp)));
                expect(is_checksum_valid(exp));
            }
            expect(!is_checksum_valid("0x5aaeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
        };
    };
};
