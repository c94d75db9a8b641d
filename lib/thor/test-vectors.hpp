/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_TEST_VECTORS_HPP
#define THOR_SDK_TEST_VECTORS_HPP

#include <thor/crypto/secp256k1.hpp>
#include <thor/transaction.hpp>

namespace thor_sdk::test {
    inline const address &reference_to()
    {
        static const auto to = address::from_hex("7567d83b7b8d80addcb281a71d54fc7b3364ffed");
        return to;
    }

    inline std::vector<clause> reference_clauses()
    {
        const auto data = uint8_vector::from_hex("000000606060");
        return { clause::call(reference_to(), 10000, data), clause::call(reference_to(), 20000, data) };
    }

    // two calls with 6 bytes of data each, shared by the encoding, hashing and signing tests
    inline transaction reference_tx(const fee_params &fee=legacy_fee { 128 })
    {
        transaction tx {};
        tx.chain_tag = 1;
        tx.block_ref = thor_sdk::block_ref::from_hex("00000000aabbccdd");
        tx.expiration = 32;
        tx.clauses = reference_clauses();
        tx.fee = fee;
        tx.gas = 21000;
        tx.nonce = 12345678;
        return tx;
    }

    inline transaction reference_dynamic_fee_tx()
    {
        return reference_tx(dynamic_fee { 10000, 20000 });
    }

    inline transaction reference_delegated_tx()
    {
        auto tx = reference_tx();
        tx.reserved = reserved::delegated();
        return tx;
    }

    inline crypto::secp256k1::private_key origin_key()
    {
        return crypto::secp256k1::private_key::from_hex("0000000000000000000000000000000000000000000000000000000000000001");
    }

    inline crypto::secp256k1::private_key delegator_key()
    {
        return crypto::secp256k1::private_key::from_hex("0000000000000000000000000000000000000000000000000000000000000002");
    }

    inline const address &origin_address()
    {
        static const auto addr = address::from_hex("7e5f4552091a69125d5dfcb7b8c2659029395bdf");
        return addr;
    }

    inline const address &delegator_address()
    {
        static const auto addr = address::from_hex("2b5ad5c4795c026514f8317c7a215e218dccd6cf");
        return addr;
    }
}

#endif // !THOR_SDK_TEST_VECTORS_HPP
