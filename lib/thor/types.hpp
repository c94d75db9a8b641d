/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_TYPES_HPP
#define THOR_SDK_TYPES_HPP

#include <thor/array.hpp>
#include <thor/big_int.hpp>
#include <thor/blake2b.hpp>

namespace thor_sdk {
    using address = byte_array<20>;
    using hash32 = blake2b_256_hash;
    using block_ref = byte_array<8>;
}

#endif // !THOR_SDK_TYPES_HPP
