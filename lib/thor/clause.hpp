/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CLAUSE_HPP
#define THOR_SDK_CLAUSE_HPP

#include <optional>
#include <thor/rlp/profile.hpp>
#include <thor/types.hpp>

namespace thor_sdk {
    static constexpr size_t clause_value_max_bytes = 32;

    // One transfer, call or contract deployment within a transaction.
    // An empty "to" means contract creation; the data then carries the bytecode.
    struct clause {
        std::optional<address> to {};
        cpp_int value {};
        uint8_vector data {};

        static clause make(const std::optional<address> &to, const cpp_int &value, const buffer data);

        static clause transfer(const address &to, const cpp_int &value);
        static clause transfer(std::string_view to, std::string_view value);
        static clause call(const address &to, const cpp_int &value, buffer data);
        static clause call(std::string_view to, std::string_view value, std::string_view data);
        static clause deploy(buffer bytecode, const cpp_int &value=0);
        static clause deploy(std::string_view bytecode, std::string_view value="0");

        static clause from_value(const rlp::value &v, std::string_view path="clause");
        rlp::value to_value() const;

        bool is_contract_creation() const noexcept
        {
            return !to.has_value();
        }

        bool operator==(const clause &o) const =default;
    };

    // the minimal big-endian form: zero is the empty string
    extern uint8_vector encode_value(const cpp_int &value, std::string_view path="clause.value");
    extern cpp_int parse_value(std::string_view text, std::string_view path="clause.value");
    extern uint8_vector parse_data(std::string_view text, std::string_view path="clause.data");

    extern rlp::kind clause_kind();
    extern const rlp::profile &clause_profile();
}

namespace fmt {
    template<>
    struct formatter<thor_sdk::clause>: formatter<int> {
        template<typename FormatContext>
        auto format(const thor_sdk::clause &c, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (c.to)
                return fmt::format_to(ctx.out(), "clause(to: 0x{}, value: {}, data: {} bytes)", *c.to, c.value.str(), c.data.size());
            return fmt::format_to(ctx.out(), "clause(deploy, value: {}, data: {} bytes)", c.value.str(), c.data.size());
        }
    };
}

#endif // !THOR_SDK_CLAUSE_HPP
