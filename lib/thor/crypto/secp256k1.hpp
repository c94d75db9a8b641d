/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CRYPTO_SECP256K1_HPP
#define THOR_SDK_CRYPTO_SECP256K1_HPP

#include <thor/array.hpp>
#include <thor/error.hpp>

namespace thor_sdk::crypto::secp256k1
{
    using private_key = secure_byte_array<32>;
    // uncompressed point without the 0x04 prefix byte
    using public_key = byte_array<64>;
    // r || s || recovery id
    using signature = byte_array<65>;

    static constexpr size_t signature_size = sizeof(signature);

    extern bool valid_private_key(const buffer &sk);
    extern public_key derive_public_key(const buffer &sk);
    extern signature sign(const buffer &msg_hash, const buffer &sk);
    extern public_key recover(const buffer &msg_hash, const buffer &sig);
}

#endif // !THOR_SDK_CRYPTO_SECP256K1_HPP
