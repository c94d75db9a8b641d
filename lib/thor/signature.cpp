/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/logger.hpp>
#include <thor/signature.hpp>

namespace thor_sdk {
    hash32 signing_hash(const transaction &tx)
    {
        return blake2b_256(tx.encode(false));
    }

    hash32 delegator_signing_hash(const hash32 &signing_hash, const address &origin)
    {
        return blake2b_256(signing_hash, origin);
    }

    hash32 transaction_id(const hash32 &signing_hash, const address &origin)
    {
        return blake2b_256(signing_hash, origin);
    }

    address recover_signer(const hash32 &hash, const buffer sig)
    {
        return recover_address(hash, sig);
    }

    signature origin_signature(const transaction &tx, const buffer &origin_key)
    {
        return crypto::secp256k1::sign(signing_hash(tx), origin_key);
    }

    signature delegator_signature(const transaction &tx, const address &origin, const buffer &delegator_key)
    {
        if (!tx.is_delegated()) [[unlikely]]
            throw signature_error("the transaction does not have the fee delegation feature enabled");
        return crypto::secp256k1::sign(delegator_signing_hash(signing_hash(tx), origin), delegator_key);
    }

    uint8_vector concat_signatures(const signature &origin_sig, const signature &delegator_sig)
    {
        uint8_vector res {};
        res.reserve(delegated_signature_size);
        res.insert(res.end(), origin_sig.begin(), origin_sig.end());
        res.insert(res.end(), delegator_sig.begin(), delegator_sig.end());
        return res;
    }

    transaction apply_signature(transaction tx)
    {
        tx.origin.reset();
        tx.delegator.reset();
        tx.id.reset();
        if (!tx.signature)
            return tx;
        const buffer sig = *tx.signature;
        const auto sig_hash = signing_hash(tx);
        switch (sig.size()) {
            case signature_size:
                tx.origin = recover_signer(sig_hash, sig);
                break;
            case delegated_signature_size:
                tx.origin = recover_signer(sig_hash, sig.subbuf(0, signature_size));
                tx.delegator = recover_signer(delegator_signing_hash(sig_hash, *tx.origin), sig.subbuf(signature_size, signature_size));
                break;
            default:
                throw signature_error(fmt::format("invalid signature length: expected {} or {} bytes, got {}",
                    signature_size, delegated_signature_size, sig.size()));
        }
        tx.id = transaction_id(sig_hash, *tx.origin);
        logger::debug("transaction {} recovered origin 0x{} delegator {}", *tx.id, *tx.origin,
            tx.delegator ? fmt::format("0x{}", *tx.delegator) : std::string { "none" });
        return tx;
    }
}
