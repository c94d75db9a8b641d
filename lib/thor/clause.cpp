/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/address.hpp>
#include <thor/clause.hpp>

namespace thor_sdk {
    uint8_vector encode_value(const cpp_int &value, const std::string_view path)
    {
        if (value < 0)
            throw field_error(path, fmt::format("negative value {} cannot be encoded", value.str()));
        auto bytes = big_int_to_bytes(value);
        if (bytes.size() > clause_value_max_bytes)
            throw field_error(path, fmt::format("numeric value exceeds max_bytes ({}): {} bytes", clause_value_max_bytes, bytes.size()));
        return bytes;
    }

    cpp_int parse_value(const std::string_view text, const std::string_view path)
    {
        try {
            return big_int_from_string(text);
        } catch (const error &ex) {
            throw field_error(path, ex.what());
        }
    }

    uint8_vector parse_data(const std::string_view text, const std::string_view path)
    {
        if (text.empty() || text == "0x")
            return {};
        if (!is_hex_0x(text))
            throw field_error(path, fmt::format("expected 0x-prefixed hex with an even number of digits but got '{}'", text));
        return bytes_from_hex(text);
    }

    clause clause::make(const std::optional<address> &to, const cpp_int &value, const buffer data)
    {
        // validates the range
        encode_value(value);
        if (!to && data.empty())
            throw clause_error("a contract creation clause must carry non-empty bytecode");
        return clause { to, value, uint8_vector(data) };
    }

    clause clause::transfer(const address &to, const cpp_int &value)
    {
        return make(to, value, {});
    }

    clause clause::transfer(const std::string_view to, const std::string_view value)
    {
        return transfer(parse_address(to, "clause.to"), parse_value(value));
    }

    clause clause::call(const address &to, const cpp_int &value, const buffer data)
    {
        return make(to, value, data);
    }

    clause clause::call(const std::string_view to, const std::string_view value, const std::string_view data)
    {
        return call(parse_address(to, "clause.to"), parse_value(value), parse_data(data));
    }

    clause clause::deploy(const buffer bytecode, const cpp_int &value)
    {
        return make({}, value, bytecode);
    }

    clause clause::deploy(const std::string_view bytecode, const std::string_view value)
    {
        return deploy(parse_data(bytecode), parse_value(value));
    }

    rlp::value clause::to_value() const
    {
        rlp::value_map m {};
        m.set("to", to ? rlp::value { static_cast<buffer>(*to) } : rlp::value {});
        m.set("value", rlp::value { value });
        m.set("data", rlp::value { static_cast<buffer>(data) });
        return rlp::value { std::move(m) };
    }

    clause clause::from_value(const rlp::value &v, const std::string_view path)
    {
        const auto &m = v.map(path);
        const auto &to_v = m.at("to", path);
        std::optional<address> to {};
        if (!to_v.is_null())
            to.emplace(static_cast<buffer>(to_v.bytes(fmt::format("{}.to", path))));
        try {
            return make(to, m.at("value", path).integer(fmt::format("{}.value", path)), m.at("data", path).bytes(fmt::format("{}.data", path)));
        } catch (const clause_error &ex) {
            throw clause_error(fmt::format("{}: {}", path, ex.what()));
        }
    }

    rlp::kind clause_kind()
    {
        return rlp::struct_of({
            { "to", rlp::optional_fixed_hex_blob(sizeof(address)) },
            { "value", rlp::numeric(clause_value_max_bytes) },
            { "data", rlp::hex_blob() }
        });
    }

    const rlp::profile &clause_profile()
    {
        static const rlp::profile p { "clause", clause_kind() };
        return p;
    }
}
