/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_FACADE_HPP
#define THOR_SDK_FACADE_HPP

#include <optional>
#include <thor/json.hpp>
#include <thor/network.hpp>
#include <thor/signature.hpp>

namespace thor_sdk::facade {
    // Every field left empty is filled with the network default or from the context
    struct options {
        std::optional<tx_type> type {};
        std::optional<thor_sdk::block_ref> block_ref {};
        std::optional<uint64_t> expiration {};
        std::optional<uint64_t> gas_price_coef {};
        std::optional<cpp_int> max_priority_fee_per_gas {};
        std::optional<cpp_int> max_fee_per_gas {};
        std::optional<uint64_t> gas {};
        std::optional<hash32> depends_on {};
        std::optional<uint64_t> nonce {};
        bool delegated = false;
        std::vector<clause> clauses {};

        // the request format of the command line tools, see etc/requests
        static options from_json(const json::value &req);
    };

    struct context {
        const network_config &network;
        const block_source &blocks;
        nonce_source &nonces;
    };

    extern transaction create(const options &opts, const context &ctx);
    // The clause list changes the signing hash: the gas is recomputed and
    // any signature together with the identities derived from it is dropped.
    extern transaction append_clause(const transaction &tx, const clause &c);
    // The same applies to every other field of the signed body
    extern transaction put_chain_tag(const transaction &tx, uint8_t chain_tag);
    extern transaction put_block_ref(const transaction &tx, const thor_sdk::block_ref &ref);
    extern transaction put_expiration(const transaction &tx, uint32_t expiration);
    extern transaction put_gas(const transaction &tx, uint64_t gas);
    extern transaction put_fee(const transaction &tx, const fee_params &fee);
    extern transaction put_nonce(const transaction &tx, uint64_t nonce);
    extern transaction put_depends_on(const transaction &tx, const std::optional<hash32> &depends_on);
    extern transaction put_delegation(const transaction &tx, bool delegated);
    extern uint8_vector encode(const transaction &tx, bool include_signature=true);
    extern transaction cast(buffer raw);
    // 65-byte sender signature; a fee-delegated transaction then goes to the gas payer's co_sign
    extern transaction sign(const transaction &tx, const buffer &origin_key);
    // The gas payer's half: the transaction must carry the sender's 65-byte signature
    extern transaction co_sign(const transaction &tx, const buffer &delegator_key);
    // Both halves in one step when a single party holds both keys
    extern transaction co_sign(const transaction &tx, const buffer &origin_key, const buffer &delegator_key);
    extern transaction with_signatures(const transaction &tx, const buffer &origin_sig, const buffer &delegator_sig);
    extern std::string id_hex(const transaction &tx);
    extern json::object to_json(const transaction &tx);
}

#endif // !THOR_SDK_FACADE_HPP
