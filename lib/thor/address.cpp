/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/address.hpp>
#include <thor/crypto/keccak.hpp>
#include <thor/error.hpp>

namespace thor_sdk {
    address derive_address(const crypto::secp256k1::public_key &vk)
    {
        const auto hash = crypto::keccak::digest(vk);
        return address { buffer { hash.data() + hash.size() - sizeof(address), sizeof(address) } };
    }

    address address_from_private_key(const buffer &sk)
    {
        return derive_address(crypto::secp256k1::derive_public_key(sk));
    }

    address recover_address(const buffer &msg_hash, const buffer &sig)
    {
        return derive_address(crypto::secp256k1::recover(msg_hash, sig));
    }

    address parse_address(const std::string_view text, const std::string_view path)
    {
        const auto hex = strip_hex_prefix(text);
        if (hex.size() != sizeof(address) * 2)
            throw field_error(path, fmt::format("expected {} bytes, got {} hex characters: '{}'", sizeof(address), hex.size(), text));
        try {
            return address::from_hex(hex);
        } catch (const error &ex) {
            throw field_error(path, fmt::format("malformed hex: {}", ex.what()));
        }
    }

    bool is_address(const std::string_view text)
    {
        return text.size() == 2 + sizeof(address) * 2 && is_hex_0x(text);
    }

    std::string to_checksum(const address &addr)
    {
        const auto lower = fmt::format("{}", addr);
        const auto hash = crypto::keccak::digest(buffer { lower });
        std::string res { "0x" };
        res.reserve(2 + lower.size());
        for (size_t i = 0; i < lower.size(); ++i) {
            const char c = lower[i];
            const uint8_t nibble = i % 2 == 0 ? hash[i / 2] >> 4 : hash[i / 2] & 0x0F;
            if (c >= 'a' && c <= 'f' && nibble >= 8)
                res += static_cast<char>(c - 'a' + 'A');
            else
                res += c;
        }
        return res;
    }

    bool is_checksum_valid(const std::string_view text)
    {
        if (!is_address(text))
            return false;
        return to_checksum(parse_address(text)) == text;
    }
}
