/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_RLP_PROFILE_HPP
#define THOR_SDK_RLP_PROFILE_HPP

#include <thor/rlp/kind.hpp>

namespace thor_sdk::rlp {
    // Walks the profile in declaration order, encoding each field with its kind.
    // The profile name is the root of the field paths in error messages.
    extern uint8_vector encode_object(const value &obj, const profile &p);
    extern value decode_object(buffer data, const profile &p);
    extern value decode_object(const item &tree, const profile &p);
}

#endif // !THOR_SDK_RLP_PROFILE_HPP
