/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_NETWORK_HPP
#define THOR_SDK_NETWORK_HPP

#include <string>
#include <thor/config.hpp>
#include <thor/transaction.hpp>

namespace thor_sdk {
    // Per-network constants and the defaults applied to newly created transactions
    struct network_config {
        std::string name {};
        uint8_t chain_tag = 0;
        std::string default_node {};
        uint32_t expiration = 32;
        uint8_t gas_price_coef = 0;
        cpp_int max_priority_fee_per_gas = 400'000;
        cpp_int max_fee_per_gas = 400'000;
        tx_type type = tx_type::dynamic_fee;

        // mainnet, testnet and solo
        static const network_config &get(std::string_view name);
        // missing keys keep the defaults of the builtin network with the same name, if any
        static network_config from_config(const std::string &name, const config &cfg);
        static network_config load(const std::string &name, const configs &cfgs);

        bool operator==(const network_config &o) const =default;
    };

    struct block_source {
        virtual ~block_source() =default;

        [[nodiscard]] hash32 best_block_id() const
        {
            return _best_block_id_impl();
        }
    private:
        virtual hash32 _best_block_id_impl() const =0;
    };

    // Serves a block id known in advance such as one fetched by an external client
    struct static_block_source: block_source {
        explicit static_block_source(const hash32 &id): _id { id }
        {
        }
    private:
        const hash32 _id;

        hash32 _best_block_id_impl() const override
        {
            return _id;
        }
    };

    inline block_ref block_ref_from_id(const hash32 &id)
    {
        return block_ref { buffer { id.data(), sizeof(block_ref) } };
    }

    struct nonce_source {
        virtual ~nonce_source() =default;

        [[nodiscard]] uint64_t next()
        {
            return _next_impl();
        }
    private:
        virtual uint64_t _next_impl() =0;
    };

    struct random_nonce_source: nonce_source {
    private:
        uint64_t _next_impl() override;
    };

    struct fixed_nonce_source: nonce_source {
        explicit fixed_nonce_source(const uint64_t nonce): _nonce { nonce }
        {
        }
    private:
        const uint64_t _nonce;

        uint64_t _next_impl() override
        {
            return _nonce;
        }
    };
}

#endif // !THOR_SDK_NETWORK_HPP
