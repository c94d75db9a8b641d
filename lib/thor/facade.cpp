/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <thor/facade.hpp>
#include <thor/gas.hpp>
#include <thor/logger.hpp>
#include <thor/narrow-cast.hpp>

namespace thor_sdk::facade {
    namespace {
        void check_fee(const cpp_int &fee, const std::string_view path)
        {
            if (fee < 0)
                throw field_error(path, fmt::format("negative value {} cannot be encoded", fee.str()));
            if (const auto sz = big_int_to_bytes(fee).size(); sz > tx_fee_max_bytes)
                throw field_error(path, fmt::format("numeric value exceeds max_bytes ({}): {} bytes", tx_fee_max_bytes, sz));
        }

        fee_params make_fee(const tx_type type, const options &opts, const network_config &net)
        {
            if (type == tx_type::legacy) {
                if (opts.max_priority_fee_per_gas || opts.max_fee_per_gas)
                    throw field_error("transaction.maxFeePerGas", "dynamic-fee fields are not allowed in a legacy transaction");
                const auto coef = opts.gas_price_coef.value_or(net.gas_price_coef);
                if (coef > std::numeric_limits<uint8_t>::max())
                    throw field_error("transaction.gasPriceCoef", fmt::format("numeric value exceeds max_bytes (1): {}", coef));
                return legacy_fee { static_cast<uint8_t>(coef) };
            }
            if (opts.gas_price_coef)
                throw field_error("transaction.gasPriceCoef", "gasPriceCoef is not allowed in a dynamic-fee transaction");
            dynamic_fee fee { opts.max_priority_fee_per_gas.value_or(net.max_priority_fee_per_gas),
                opts.max_fee_per_gas.value_or(net.max_fee_per_gas) };
            check_fee(fee.max_priority_fee_per_gas, "transaction.maxPriorityFeePerGas");
            check_fee(fee.max_fee_per_gas, "transaction.maxFeePerGas");
            return fee;
        }

        template<typename F>
        transaction modify(const transaction &tx, const F &change)
        {
            auto res = tx;
            change(res);
            if (res.signature)
                logger::debug("dropping the signature of a transaction modified after signing");
            res.signature.reset();
            return apply_signature(std::move(res));
        }

        std::optional<uint64_t> json_uint(const json::object &obj, const std::string_view name)
        {
            const auto *jv = obj.if_contains(name);
            if (!jv || jv->is_null())
                return {};
            if (jv->is_uint64())
                return jv->get_uint64();
            if (jv->is_int64() && jv->get_int64() >= 0)
                return static_cast<uint64_t>(jv->get_int64());
            if (jv->is_string())
                return narrow_cast<uint64_t>(parse_value(json::value_to<std::string>(*jv), fmt::format("request.{}", name)));
            throw field_error(fmt::format("request.{}", name), "expected a non-negative integer");
        }

        std::optional<cpp_int> json_big_int(const json::object &obj, const std::string_view name)
        {
            const auto *jv = obj.if_contains(name);
            if (!jv || jv->is_null())
                return {};
            if (jv->is_uint64())
                return cpp_int { jv->get_uint64() };
            if (jv->is_int64())
                return cpp_int { jv->get_int64() };
            if (jv->is_string())
                return parse_value(json::value_to<std::string>(*jv), fmt::format("request.{}", name));
            throw field_error(fmt::format("request.{}", name), "expected an integer or an integer string");
        }

        std::optional<std::string> json_text(const json::object &obj, const std::string_view name)
        {
            const auto *jv = obj.if_contains(name);
            if (!jv || jv->is_null())
                return {};
            if (!jv->is_string())
                throw field_error(fmt::format("request.{}", name), "expected a text value");
            return json::value_to<std::string>(*jv);
        }

        template<size_t SZ>
        byte_array<SZ> parse_fixed(const std::string_view text, const std::string_view path)
        {
            const auto bytes = parse_data(text, path);
            if (bytes.size() != SZ)
                throw field_error(path, fmt::format("expected {} bytes, got {}", SZ, bytes.size()));
            return byte_array<SZ>(static_cast<buffer>(bytes));
        }

        clause clause_from_json(const json::value &jv, const std::string_view path)
        {
            if (!jv.is_object())
                throw field_error(path, "expected an object");
            const auto &obj = jv.get_object();
            const auto to = json_text(obj, "to");
            const auto data = json_text(obj, "data").value_or("0x");
            cpp_int value {};
            if (const auto v = json_big_int(obj, "value"); v)
                value = *v;
            try {
                std::optional<address> to_addr {};
                if (to)
                    to_addr = parse_address(*to, fmt::format("{}.to", path));
                return clause::make(to_addr, value, parse_data(data, fmt::format("{}.data", path)));
            } catch (const clause_error &ex) {
                throw clause_error(fmt::format("{}: {}", path, ex.what()));
            }
        }

        json::value optional_checksum(const std::optional<address> &addr)
        {
            if (!addr)
                return nullptr;
            return json::value(to_checksum(*addr));
        }
    }

    options options::from_json(const json::value &req)
    {
        if (!req.is_object())
            throw field_error("request", "expected an object");
        const auto &obj = req.get_object();
        options opts {};
        if (const auto type = json_text(obj, "type"); type)
            opts.type = tx_type_from_name(*type);
        if (const auto ref = json_text(obj, "blockRef"); ref)
            opts.block_ref = parse_fixed<sizeof(thor_sdk::block_ref)>(*ref, "request.blockRef");
        opts.expiration = json_uint(obj, "expiration");
        opts.gas_price_coef = json_uint(obj, "gasPriceCoef");
        opts.max_priority_fee_per_gas = json_big_int(obj, "maxPriorityFeePerGas");
        opts.max_fee_per_gas = json_big_int(obj, "maxFeePerGas");
        opts.gas = json_uint(obj, "gas");
        if (const auto dep = json_text(obj, "dependsOn"); dep && !dep->empty() && *dep != "0x")
            opts.depends_on = parse_fixed<sizeof(hash32)>(*dep, "request.dependsOn");
        opts.nonce = json_uint(obj, "nonce");
        if (const auto *del = obj.if_contains("delegated"); del && !del->is_null()) {
            if (!del->is_bool())
                throw field_error("request.delegated", "expected a boolean");
            opts.delegated = del->get_bool();
        }
        if (const auto *clauses = obj.if_contains("clauses"); clauses && !clauses->is_null()) {
            if (!clauses->is_array())
                throw field_error("request.clauses", "expected an array");
            const auto &arr = clauses->get_array();
            for (size_t i = 0; i < arr.size(); ++i)
                opts.clauses.emplace_back(clause_from_json(arr[i], fmt::format("request.clauses[{}]", i)));
        }
        return opts;
    }

    transaction create(const options &opts, const context &ctx)
    {
        const auto &net = ctx.network;
        const auto type = opts.type.value_or(net.type);
        transaction tx {};
        tx.chain_tag = net.chain_tag;
        if (opts.block_ref)
            tx.block_ref = *opts.block_ref;
        else
            tx.block_ref = block_ref_from_id(ctx.blocks.best_block_id());
        const auto expiration = opts.expiration.value_or(net.expiration);
        if (expiration == 0 || expiration > std::numeric_limits<uint32_t>::max())
            throw field_error("transaction.expiration", fmt::format("expiration must be within [1, {}] blocks but got {}",
                std::numeric_limits<uint32_t>::max(), expiration));
        tx.expiration = static_cast<uint32_t>(expiration);
        tx.fee = make_fee(type, opts, net);
        tx.clauses = opts.clauses;
        tx.gas = opts.gas ? *opts.gas : intrinsic_gas(tx.clauses);
        tx.depends_on = opts.depends_on;
        tx.nonce = opts.nonce ? *opts.nonce : ctx.nonces.next();
        tx.reserved.set_delegation(opts.delegated);
        logger::debug("created a {} transaction for {} with {} clauses, gas: {} delegated: {}",
            type, net.name, tx.clauses.size(), tx.gas, tx.is_delegated());
        return tx;
    }

    transaction append_clause(const transaction &tx, const clause &c)
    {
        return modify(tx, [&c](transaction &res) {
            res.clauses.emplace_back(c);
            res.gas = intrinsic_gas(res.clauses);
        });
    }

    transaction put_chain_tag(const transaction &tx, const uint8_t chain_tag)
    {
        return modify(tx, [&](transaction &res) { res.chain_tag = chain_tag; });
    }

    transaction put_block_ref(const transaction &tx, const thor_sdk::block_ref &ref)
    {
        return modify(tx, [&](transaction &res) { res.block_ref = ref; });
    }

    transaction put_expiration(const transaction &tx, const uint32_t expiration)
    {
        if (expiration == 0)
            throw field_error("transaction.expiration", "expiration must be at least 1 block");
        return modify(tx, [&](transaction &res) { res.expiration = expiration; });
    }

    transaction put_gas(const transaction &tx, const uint64_t gas)
    {
        return modify(tx, [&](transaction &res) { res.gas = gas; });
    }

    transaction put_fee(const transaction &tx, const fee_params &fee)
    {
        if (const auto *dyn = std::get_if<dynamic_fee>(&fee); dyn) {
            check_fee(dyn->max_priority_fee_per_gas, "transaction.maxPriorityFeePerGas");
            check_fee(dyn->max_fee_per_gas, "transaction.maxFeePerGas");
        }
        return modify(tx, [&](transaction &res) { res.fee = fee; });
    }

    transaction put_nonce(const transaction &tx, const uint64_t nonce)
    {
        return modify(tx, [&](transaction &res) { res.nonce = nonce; });
    }

    transaction put_depends_on(const transaction &tx, const std::optional<hash32> &depends_on)
    {
        return modify(tx, [&](transaction &res) { res.depends_on = depends_on; });
    }

    transaction put_delegation(const transaction &tx, const bool delegated)
    {
        return modify(tx, [&](transaction &res) { res.reserved.set_delegation(delegated); });
    }

    uint8_vector encode(const transaction &tx, const bool include_signature)
    {
        return tx.encode(include_signature);
    }

    transaction cast(const buffer raw)
    {
        const auto shape = classify(raw);
        const auto &p = tx_profile(shape.type, shape.is_signed);
        const auto val = rlp::decode_object(shape.body, p);
        return apply_signature(transaction::from_value(val, shape.type, p.name));
    }

    transaction sign(const transaction &tx, const buffer &origin_key)
    {
        auto res = tx;
        res.signature.emplace(static_cast<buffer>(origin_signature(res, origin_key)));
        return apply_signature(std::move(res));
    }

    transaction co_sign(const transaction &tx, const buffer &delegator_key)
    {
        if (!tx.is_delegated()) [[unlikely]]
            throw signature_error("the transaction does not have the fee delegation feature enabled");
        if (!tx.signature || tx.signature->size() != signature_size) [[unlikely]]
            throw signature_error(fmt::format("the gas payer signs after the sender: expected a {}-byte sender signature but got {}",
                signature_size, tx.signature ? tx.signature->size() : 0));
        // recovers the origin when the value did not come from cast or sign
        const auto signed_tx = tx.origin ? tx : apply_signature(tx);
        const signature origin_sig { static_cast<buffer>(*signed_tx.signature) };
        return with_signatures(signed_tx, origin_sig, delegator_signature(signed_tx, *signed_tx.origin, delegator_key));
    }

    transaction co_sign(const transaction &tx, const buffer &origin_key, const buffer &delegator_key)
    {
        if (!tx.is_delegated()) [[unlikely]]
            throw signature_error("the transaction does not have the fee delegation feature enabled");
        return co_sign(sign(tx, origin_key), delegator_key);
    }

    transaction with_signatures(const transaction &tx, const buffer &origin_sig, const buffer &delegator_sig)
    {
        if (origin_sig.size() != signature_size)
            throw signature_error(fmt::format("the origin signature must have {} bytes but got {}", signature_size, origin_sig.size()));
        if (delegator_sig.size() != signature_size)
            throw signature_error(fmt::format("the delegator signature must have {} bytes but got {}", signature_size, delegator_sig.size()));
        auto res = tx;
        res.signature.emplace(concat_signatures(signature(origin_sig), signature(delegator_sig)));
        return apply_signature(std::move(res));
    }

    std::string id_hex(const transaction &tx)
    {
        if (!tx.id)
            throw error("the transaction has no id until it is signed");
        return to_hex_0x(*tx.id);
    }

    json::object to_json(const transaction &tx)
    {
        json::object res {};
        res.emplace("id", tx.id ? json::value(to_hex_0x(*tx.id)) : json::value(nullptr));
        res.emplace("type", std::string { tx_type_name(tx.type()) });
        res.emplace("chainTag", tx.chain_tag);
        res.emplace("blockRef", to_hex_0x(tx.block_ref));
        res.emplace("expiration", tx.expiration);
        json::array clauses {};
        for (const auto &c: tx.clauses) {
            json::object c_json {};
            c_json.emplace("to", optional_checksum(c.to));
            c_json.emplace("value", c.value.str());
            c_json.emplace("data", to_hex_0x(c.data));
            clauses.emplace_back(std::move(c_json));
        }
        res.emplace("clauses", std::move(clauses));
        std::visit([&res](const auto &f) {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, legacy_fee>) {
                res.emplace("gasPriceCoef", f.gas_price_coef);
            } else {
                res.emplace("maxPriorityFeePerGas", f.max_priority_fee_per_gas.str());
                res.emplace("maxFeePerGas", f.max_fee_per_gas.str());
            }
        }, tx.fee);
        res.emplace("gas", tx.gas);
        res.emplace("intrinsicGas", intrinsic_gas(tx.clauses));
        res.emplace("dependsOn", tx.depends_on ? json::value(to_hex_0x(*tx.depends_on)) : json::value(nullptr));
        res.emplace("nonce", tx.nonce);
        res.emplace("delegated", tx.is_delegated());
        res.emplace("origin", optional_checksum(tx.origin));
        res.emplace("delegator", optional_checksum(tx.delegator));
        res.emplace("signature", tx.signature ? json::value(to_hex_0x(*tx.signature)) : json::value(nullptr));
        res.emplace("size", tx.encode().size());
        return res;
    }
}
