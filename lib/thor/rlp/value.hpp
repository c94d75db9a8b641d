/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_RLP_VALUE_HPP
#define THOR_SDK_RLP_VALUE_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <thor/big_int.hpp>
#include <thor/common/bytes.hpp>
#include <thor/error.hpp>

namespace thor_sdk::rlp {
    struct value;
    using value_list = std::vector<value>;
    using value_field = std::pair<std::string, value>;

    // Named fields in declaration order
    struct value_map: std::vector<value_field> {
        const value *find(std::string_view name) const;
        // missing fields are reported as parent_path.name
        const value &at(std::string_view name, std::string_view parent_path) const;
        value_map &set(std::string_view name, value &&v);
    };

    // Structured side of the codec: what a kind encodes from and decodes into.
    // Text holds the caller-facing forms: 0x-prefixed hex or decimal integers.
    struct value {
        using value_type = std::variant<std::monostate, cpp_int, uint8_vector, std::string, value_list, value_map>;

        value() =default;

        value(const cpp_int &v): _val { v }
        {
        }

        template<typename T>
            requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
        value(const T v): _val { cpp_int { v } }
        {
        }

        value(uint8_vector &&v): _val { std::move(v) }
        {
        }

        value(const buffer v): _val { uint8_vector(v) }
        {
        }

        value(std::string v): _val { std::move(v) }
        {
        }

        value(const std::string_view v): _val { std::string { v } }
        {
        }

        value(const char *v): _val { std::string { v } }
        {
        }

        value(value_list &&v): _val { std::move(v) }
        {
        }

        value(value_map &&v): _val { std::move(v) }
        {
        }

        bool is_null() const noexcept
        {
            return std::holds_alternative<std::monostate>(_val);
        }

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(_val);
        }

        template<typename T>
        const T &as(const std::string_view path) const
        {
            if (const auto *v = std::get_if<T>(&_val); v)
                return *v;
            throw field_error(path, fmt::format("expected {} but got {}", type_name<T>(), type_name()));
        }

        const cpp_int &integer(const std::string_view path) const
        {
            return as<cpp_int>(path);
        }

        const uint8_vector &bytes(const std::string_view path) const
        {
            return as<uint8_vector>(path);
        }

        const value_list &list(const std::string_view path) const
        {
            return as<value_list>(path);
        }

        const value_map &map(const std::string_view path) const
        {
            return as<value_map>(path);
        }

        const value_type &variant() const noexcept
        {
            return _val;
        }

        std::string_view type_name() const noexcept;

        bool operator==(const value &o) const
        {
            return _val == o._val;
        }
    private:
        value_type _val {};

        template<typename T>
        static std::string_view type_name() noexcept
        {
            if constexpr (std::is_same_v<T, cpp_int>)
                return "an integer";
            else if constexpr (std::is_same_v<T, uint8_vector>)
                return "a byte string";
            else if constexpr (std::is_same_v<T, std::string>)
                return "a text";
            else if constexpr (std::is_same_v<T, value_list>)
                return "a list";
            else if constexpr (std::is_same_v<T, value_map>)
                return "an object";
            else
                return "null";
        }
    };

    inline std::string_view value::type_name() const noexcept
    {
        return std::visit([](const auto &v) {
            return type_name<std::decay_t<decltype(v)>>();
        }, _val);
    }

    inline const value *value_map::find(const std::string_view name) const
    {
        for (const auto &[k, v]: *this) {
            if (k == name)
                return &v;
        }
        return nullptr;
    }

    inline const value &value_map::at(const std::string_view name, const std::string_view parent_path) const
    {
        if (const auto *v = find(name); v)
            return *v;
        throw field_error(fmt::format("{}.{}", parent_path, name), "the field is missing");
    }

    inline value_map &value_map::set(const std::string_view name, value &&v)
    {
        for (auto &[k, old_v]: *this) {
            if (k == name) {
                old_v = std::move(v);
                return *this;
            }
        }
        emplace_back(std::string { name }, std::move(v));
        return *this;
    }
}

namespace fmt {
    template<>
    struct formatter<thor_sdk::rlp::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const thor_sdk::rlp::value &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace thor_sdk;
            return std::visit([&ctx](const auto &val) {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return fmt::format_to(ctx.out(), "null");
                } else if constexpr (std::is_same_v<T, cpp_int>) {
                    return fmt::format_to(ctx.out(), "{}", val.str());
                } else if constexpr (std::is_same_v<T, uint8_vector>) {
                    return fmt::format_to(ctx.out(), "0x{}", val);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(ctx.out(), "'{}'", val);
                } else if constexpr (std::is_same_v<T, rlp::value_list>) {
                    auto out_it = fmt::format_to(ctx.out(), "[");
                    for (auto it = val.begin(); it != val.end(); ++it) {
                        if (it != val.begin())
                            out_it = fmt::format_to(out_it, ", ");
                        out_it = fmt::format_to(out_it, "{}", *it);
                    }
                    return fmt::format_to(out_it, "]");
                } else {
                    auto out_it = fmt::format_to(ctx.out(), "{{");
                    for (auto it = val.begin(); it != val.end(); ++it) {
                        if (it != val.begin())
                            out_it = fmt::format_to(out_it, ", ");
                        out_it = fmt::format_to(out_it, "{}: {}", it->first, it->second);
                    }
                    return fmt::format_to(out_it, "}}");
                }
            }, v.variant());
        }
    };
}

#endif // !THOR_SDK_RLP_VALUE_HPP
