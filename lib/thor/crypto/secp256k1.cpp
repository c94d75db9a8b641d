/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <thor/crypto/secp256k1.hpp>

namespace thor_sdk::crypto::secp256k1 {
    struct context {
        static const secp256k1_context *get()
        {
            static context ctx { SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY };
            return ctx.ptr();
        }

        context(const unsigned flags): _ctx { secp256k1_context_create(flags) }
        {
            if (!_ctx)
                throw error("failure to create a SECP256K1 context");
        }

        context(const context &) =delete;
        context &operator=(const context &) =delete;

        ~context()
        {
            secp256k1_context_destroy(_ctx);
        }

        const secp256k1_context *ptr() const
        {
            return _ctx;
        }
    private:
        secp256k1_context *_ctx;
    };

    static void check_hash(const buffer &msg_hash)
    {
        if (const auto exp_size = 32; msg_hash.size() != exp_size)
            throw signature_error(fmt::format("ECDSA message hash must have {} bytes but got {}", exp_size, msg_hash.size()));
    }

    static void check_private_key(const buffer &sk)
    {
        if (!valid_private_key(sk))
            throw signature_error("the private key is not a valid secp256k1 scalar");
    }

    static public_key serialize(const secp256k1_pubkey &vk)
    {
        std::array<uint8_t, 65> ser {};
        size_t ser_size = ser.size();
        if (!secp256k1_ec_pubkey_serialize(context::get(), ser.data(), &ser_size, &vk, SECP256K1_EC_UNCOMPRESSED) || ser_size != ser.size())
            throw signature_error("failed to serialize a secp256k1 public key");
        return public_key { buffer { ser.data() + 1, ser.size() - 1 } };
    }

    bool valid_private_key(const buffer &sk)
    {
        return sk.size() == sizeof(private_key) && secp256k1_ec_seckey_verify(context::get(), sk.data()) == 1;
    }

    public_key derive_public_key(const buffer &sk)
    {
        check_private_key(sk);
        secp256k1_pubkey vk;
        if (!secp256k1_ec_pubkey_create(context::get(), &vk, sk.data()))
            throw signature_error("failed to derive a secp256k1 public key");
        return serialize(vk);
    }

    signature sign(const buffer &msg_hash, const buffer &sk)
    {
        check_hash(msg_hash);
        check_private_key(sk);
        secp256k1_ecdsa_recoverable_signature sig;
        if (!secp256k1_ecdsa_sign_recoverable(context::get(), &sig, msg_hash.data(), sk.data(), nullptr, nullptr))
            throw signature_error("failed to create a recoverable ECDSA signature");
        signature res {};
        int rec_id = 0;
        secp256k1_ecdsa_recoverable_signature_serialize_compact(context::get(), res.data(), &rec_id, &sig);
        res[64] = static_cast<uint8_t>(rec_id);
        return res;
    }

    public_key recover(const buffer &msg_hash, const buffer &sig)
    {
        check_hash(msg_hash);
        if (sig.size() != signature_size)
            throw signature_error(fmt::format("a recoverable ECDSA signature must have {} bytes but got {}", signature_size, sig.size()));
        const int rec_id = sig[64];
        if (rec_id > 3)
            throw signature_error(fmt::format("invalid ECDSA recovery id: {}", rec_id));
        secp256k1_ecdsa_recoverable_signature sig_parsed;
        if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context::get(), &sig_parsed, sig.data(), rec_id))
            throw signature_error(fmt::format("failed to parse ECDSA signature: {}", sig));
        secp256k1_pubkey vk;
        if (!secp256k1_ecdsa_recover(context::get(), &vk, &sig_parsed, msg_hash.data()))
            throw signature_error(fmt::format("failed to recover the public key from ECDSA signature: {}", sig));
        return serialize(vk);
    }
}
