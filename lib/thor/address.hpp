/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_ADDRESS_HPP
#define THOR_SDK_ADDRESS_HPP

#include <string>
#include <thor/crypto/secp256k1.hpp>
#include <thor/types.hpp>

namespace thor_sdk {
    // last 20 bytes of keccak-256 over the 64-byte public key
    extern address derive_address(const crypto::secp256k1::public_key &vk);
    extern address address_from_private_key(const buffer &sk);
    extern address recover_address(const buffer &msg_hash, const buffer &sig);

    // accepts text with or without 0x; fails unless it describes exactly 20 bytes
    extern address parse_address(std::string_view text, std::string_view path="address");
    extern bool is_address(std::string_view text);

    // EIP-55 mixed-case form with the 0x prefix
    extern std::string to_checksum(const address &addr);
    extern bool is_checksum_valid(std::string_view text);
}

#endif // !THOR_SDK_ADDRESS_HPP
