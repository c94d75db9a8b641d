/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_TRANSACTION_HPP
#define THOR_SDK_TRANSACTION_HPP

#include <optional>
#include <variant>
#include <vector>
#include <thor/clause.hpp>
#include <thor/reserved.hpp>
#include <thor/types.hpp>

namespace thor_sdk {
    enum class tx_type: uint8_t {
        legacy,
        dynamic_fee
    };

    // the first byte of every encoded dynamic-fee transaction, the RLP list follows it
    static constexpr uint8_t dynamic_fee_prefix = 0x51;
    static constexpr size_t tx_fee_max_bytes = 32;

    struct legacy_fee {
        uint8_t gas_price_coef = 0;

        bool operator==(const legacy_fee &o) const =default;
    };

    struct dynamic_fee {
        cpp_int max_priority_fee_per_gas {};
        cpp_int max_fee_per_gas {};

        bool operator==(const dynamic_fee &o) const =default;
    };

    // A transaction has exactly one of the two gas-pricing shapes
    using fee_params = std::variant<legacy_fee, dynamic_fee>;

    // A plain value: editing a field of a signed transaction leaves signature, origin, delegator and id
    // stale until apply_signature runs. The facade::put_* functions drop the signature and rederive them.
    struct transaction {
        std::optional<hash32> id {};
        uint8_t chain_tag = 0;
        thor_sdk::block_ref block_ref {};
        uint32_t expiration = 0;
        std::vector<clause> clauses {};
        fee_params fee {};
        uint64_t gas = 0;
        std::optional<hash32> depends_on {};
        uint64_t nonce = 0;
        thor_sdk::reserved reserved {};
        // 65 bytes for a single signature, 130 bytes for origin and delegator
        std::optional<uint8_vector> signature {};
        std::optional<address> origin {};
        std::optional<address> delegator {};

        tx_type type() const noexcept
        {
            return std::holds_alternative<dynamic_fee>(fee) ? tx_type::dynamic_fee : tx_type::legacy;
        }

        bool is_signed() const noexcept
        {
            return signature.has_value();
        }

        bool is_delegated() const noexcept
        {
            return reserved.is_delegated();
        }

        // the wire-level object: the fields of the matching profile in wire order
        rlp::value to_value(bool include_signature=true) const;
        static transaction from_value(const rlp::value &v, tx_type type, std::string_view path="transaction");
        // dynamic-fee transactions are prefixed with the type byte
        uint8_vector encode(bool include_signature=true) const;

        bool operator==(const transaction &o) const =default;
    };

    // The outcome of inspecting raw bytes before a full decode
    struct tx_shape {
        tx_type type;
        bool is_signed;
        rlp::item body;
    };

    extern const rlp::profile &tx_profile(tx_type type, bool is_signed);
    // legacy: 9 unsigned and 10 signed, dynamic-fee: 10 and 11 since two fee fields replace gasPriceCoef
    extern size_t tx_field_count(tx_type type, bool is_signed);
    extern tx_shape classify(buffer raw);
    extern std::string_view tx_type_name(tx_type type);
    extern tx_type tx_type_from_name(std::string_view name);
}

namespace fmt {
    template<>
    struct formatter<thor_sdk::tx_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const thor_sdk::tx_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", thor_sdk::tx_type_name(v));
        }
    };
}

#endif // !THOR_SDK_TRANSACTION_HPP
