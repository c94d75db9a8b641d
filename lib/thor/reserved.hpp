/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_RESERVED_HPP
#define THOR_SDK_RESERVED_HPP

#include <vector>
#include <thor/rlp/profile.hpp>

namespace thor_sdk {
    // The forward-compatible extension list carried by every transaction:
    // [features, unused...] or the empty list when nothing is set.
    struct reserved {
        static constexpr uint32_t feature_delegation = 0x01;
        static constexpr size_t features_max_bytes = sizeof(uint32_t);

        uint32_t features = 0;
        std::vector<uint8_vector> unused {};

        static reserved delegated()
        {
            return reserved { feature_delegation };
        }

        bool is_delegated() const noexcept
        {
            return (features & feature_delegation) != 0;
        }

        reserved &set_delegation(const bool enabled) noexcept
        {
            if (enabled)
                features |= feature_delegation;
            else
                features &= ~feature_delegation;
            return *this;
        }

        bool empty() const noexcept
        {
            return features == 0 && unused.empty();
        }

        static reserved from_value(const rlp::value &v, std::string_view path="reserved");
        rlp::value to_value() const;

        bool operator==(const reserved &o) const =default;
    };

    extern rlp::kind reserved_kind();
}

#endif // !THOR_SDK_RESERVED_HPP
