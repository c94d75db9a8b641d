/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/logger.hpp>
#include <thor/narrow-cast.hpp>
#include <thor/transaction.hpp>

namespace thor_sdk {
    namespace {
        std::vector<rlp::profile> tx_fields(const tx_type type, const bool is_signed)
        {
            std::vector<rlp::profile> fields {};
            fields.push_back(rlp::profile { "chainTag", rlp::numeric(1) });
            fields.push_back(rlp::profile { "blockRef", rlp::compact_fixed_hex_blob(sizeof(block_ref)) });
            fields.push_back(rlp::profile { "expiration", rlp::numeric(4) });
            fields.push_back(rlp::profile { "clauses", rlp::array_of(clause_kind()) });
            switch (type) {
                case tx_type::legacy:
                    fields.push_back(rlp::profile { "gasPriceCoef", rlp::numeric(1) });
                    break;
                case tx_type::dynamic_fee:
                    fields.push_back(rlp::profile { "maxPriorityFeePerGas", rlp::numeric(tx_fee_max_bytes) });
                    fields.push_back(rlp::profile { "maxFeePerGas", rlp::numeric(tx_fee_max_bytes) });
                    break;
                default:
                    throw error(fmt::format("unsupported transaction type: {}", static_cast<int>(type)));
            }
            fields.push_back(rlp::profile { "gas", rlp::numeric(8) });
            fields.push_back(rlp::profile { "dependsOn", rlp::optional_fixed_hex_blob(sizeof(hash32)) });
            fields.push_back(rlp::profile { "nonce", rlp::numeric(8) });
            fields.push_back(rlp::profile { "reserved", reserved_kind() });
            if (is_signed)
                fields.push_back(rlp::profile { "signature", rlp::hex_blob() });
            return fields;
        }

        rlp::profile make_profile(const tx_type type, const bool is_signed)
        {
            std::string name = type == tx_type::dynamic_fee ? "dynamic_fee_transaction" : "transaction";
            if (is_signed)
                name = "signed_" + name;
            return rlp::profile { std::move(name), rlp::struct_of(tx_fields(type, is_signed)) };
        }

        std::string child_path(const std::string_view path, const std::string_view name)
        {
            return fmt::format("{}.{}", path, name);
        }

        template<typename T>
        T integer_field(const rlp::value_map &m, const std::string_view path, const std::string_view name)
        {
            const auto f_path = child_path(path, name);
            try {
                return narrow_cast<T>(m.at(name, path).integer(f_path));
            } catch (const field_error &) {
                throw;
            } catch (const error &ex) {
                throw field_error(f_path, ex.what());
            }
        }
    }

    std::string_view tx_type_name(const tx_type type)
    {
        switch (type) {
            case tx_type::legacy: return "legacy";
            case tx_type::dynamic_fee: return "dynamic-fee";
            default: throw error(fmt::format("unsupported transaction type: {}", static_cast<int>(type)));
        }
    }

    tx_type tx_type_from_name(const std::string_view name)
    {
        if (name == "legacy")
            return tx_type::legacy;
        if (name == "dynamic-fee")
            return tx_type::dynamic_fee;
        throw error(fmt::format("unsupported transaction type name: '{}'", name));
    }

    const rlp::profile &tx_profile(const tx_type type, const bool is_signed)
    {
        static const rlp::profile legacy_unsigned = make_profile(tx_type::legacy, false);
        static const rlp::profile legacy_signed = make_profile(tx_type::legacy, true);
        static const rlp::profile dynamic_unsigned = make_profile(tx_type::dynamic_fee, false);
        static const rlp::profile dynamic_signed = make_profile(tx_type::dynamic_fee, true);
        if (type == tx_type::dynamic_fee)
            return is_signed ? dynamic_signed : dynamic_unsigned;
        return is_signed ? legacy_signed : legacy_unsigned;
    }

    size_t tx_field_count(const tx_type type, const bool is_signed)
    {
        const auto &k = std::get<rlp::struct_kind>(tx_profile(type, is_signed).type.variant());
        return k.fields.size();
    }

    tx_shape classify(const buffer raw)
    {
        if (raw.empty()) [[unlikely]]
            throw decode_error("transaction", "the encoded transaction is empty");
        tx_type type = tx_type::legacy;
        buffer body_bytes = raw;
        if (raw[0] == dynamic_fee_prefix) {
            type = tx_type::dynamic_fee;
            body_bytes = raw.subbuf(1);
        } else if (raw[0] < 0xC0) {
            throw decode_error("transaction", fmt::format("unsupported transaction type prefix: 0x{:02x}", raw[0]));
        }
        auto body = rlp::decode(body_bytes, "transaction");
        const auto type_desc = type == tx_type::dynamic_fee ? "dynamic-fee" : "legacy";
        if (!body.is_list())
            throw decode_error("transaction", fmt::format("Invalid {} transaction structure: expected a list", type_desc));
        const auto num_fields = body.list().size();
        const auto unsigned_fields = tx_field_count(type, false);
        const auto signed_fields = tx_field_count(type, true);
        if (num_fields != unsigned_fields && num_fields != signed_fields)
            throw decode_error("transaction", fmt::format("Invalid {} transaction structure: expected {} or {} fields, got {}",
                type_desc, unsigned_fields, signed_fields, num_fields));
        const bool is_signed = num_fields == signed_fields;
        logger::trace("classified {} bytes as a {} {} transaction", raw.size(), is_signed ? "signed" : "unsigned", type_desc);
        return tx_shape { type, is_signed, std::move(body) };
    }

    rlp::value transaction::to_value(const bool include_signature) const
    {
        rlp::value_map m {};
        m.set("chainTag", rlp::value { chain_tag });
        m.set("blockRef", rlp::value { static_cast<buffer>(block_ref) });
        m.set("expiration", rlp::value { expiration });
        rlp::value_list clause_vals {};
        clause_vals.reserve(clauses.size());
        for (const auto &c: clauses)
            clause_vals.emplace_back(c.to_value());
        m.set("clauses", rlp::value { std::move(clause_vals) });
        std::visit([&m](const auto &f) {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, legacy_fee>) {
                m.set("gasPriceCoef", rlp::value { f.gas_price_coef });
            } else {
                m.set("maxPriorityFeePerGas", rlp::value { f.max_priority_fee_per_gas });
                m.set("maxFeePerGas", rlp::value { f.max_fee_per_gas });
            }
        }, fee);
        m.set("gas", rlp::value { gas });
        m.set("dependsOn", depends_on ? rlp::value { static_cast<buffer>(*depends_on) } : rlp::value {});
        m.set("nonce", rlp::value { nonce });
        m.set("reserved", reserved.to_value());
        if (include_signature && signature)
            m.set("signature", rlp::value { static_cast<buffer>(*signature) });
        return rlp::value { std::move(m) };
    }

    transaction transaction::from_value(const rlp::value &v, const tx_type type, const std::string_view path)
    {
        const auto &m = v.map(path);
        transaction tx {};
        tx.chain_tag = integer_field<uint8_t>(m, path, "chainTag");
        tx.block_ref = static_cast<buffer>(m.at("blockRef", path).bytes(child_path(path, "blockRef")));
        tx.expiration = integer_field<uint32_t>(m, path, "expiration");
        const auto clauses_path = child_path(path, "clauses");
        const auto &clause_vals = m.at("clauses", path).list(clauses_path);
        tx.clauses.reserve(clause_vals.size());
        for (size_t i = 0; i < clause_vals.size(); ++i)
            tx.clauses.emplace_back(clause::from_value(clause_vals[i], fmt::format("{}[{}]", clauses_path, i)));
        if (type == tx_type::dynamic_fee) {
            tx.fee = dynamic_fee {
                m.at("maxPriorityFeePerGas", path).integer(child_path(path, "maxPriorityFeePerGas")),
                m.at("maxFeePerGas", path).integer(child_path(path, "maxFeePerGas"))
            };
        } else {
            tx.fee = legacy_fee { integer_field<uint8_t>(m, path, "gasPriceCoef") };
        }
        tx.gas = integer_field<uint64_t>(m, path, "gas");
        if (const auto &dep = m.at("dependsOn", path); !dep.is_null())
            tx.depends_on.emplace(static_cast<buffer>(dep.bytes(child_path(path, "dependsOn"))));
        tx.nonce = integer_field<uint64_t>(m, path, "nonce");
        tx.reserved = thor_sdk::reserved::from_value(m.at("reserved", path), child_path(path, "reserved"));
        if (const auto *sig = m.find("signature"); sig)
            tx.signature.emplace(sig->bytes(child_path(path, "signature")));
        return tx;
    }

    uint8_vector transaction::encode(const bool include_signature) const
    {
        const bool with_sig = include_signature && signature.has_value();
        const auto &p = tx_profile(type(), with_sig);
        auto body = rlp::encode_object(to_value(with_sig), p);
        if (type() == tx_type::legacy)
            return body;
        uint8_vector res {};
        res.reserve(body.size() + 1);
        res.push_back(dynamic_fee_prefix);
        res.insert(res.end(), body.begin(), body.end());
        return res;
    }
}
