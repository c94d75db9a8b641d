/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_SIGNATURE_HPP
#define THOR_SDK_SIGNATURE_HPP

#include <thor/address.hpp>
#include <thor/transaction.hpp>

namespace thor_sdk {
    using crypto::secp256k1::signature;
    using crypto::secp256k1::signature_size;
    // origin signature followed by the delegator signature
    static constexpr size_t delegated_signature_size = 2 * signature_size;

    // blake2b-256 of the encoding without the signature, the type prefix included
    extern hash32 signing_hash(const transaction &tx);
    // The delegator signs a hash bound to the sender, so its signature
    // cannot be replayed with a transaction from a different origin.
    extern hash32 delegator_signing_hash(const hash32 &signing_hash, const address &origin);
    extern hash32 transaction_id(const hash32 &signing_hash, const address &origin);

    extern address recover_signer(const hash32 &hash, buffer sig);
    extern signature origin_signature(const transaction &tx, const buffer &origin_key);
    extern signature delegator_signature(const transaction &tx, const address &origin, const buffer &delegator_key);
    extern uint8_vector concat_signatures(const signature &origin_sig, const signature &delegator_sig);

    // Derives origin, delegator and id from the signature currently attached to the transaction:
    // none clears them, 65 bytes recover the origin, 130 bytes recover both parties.
    extern transaction apply_signature(transaction tx);
}

#endif // !THOR_SDK_SIGNATURE_HPP
