/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CRYPTO_RANDOM_HPP
#define THOR_SDK_CRYPTO_RANDOM_HPP

#include <span>
#include <thor/common/bytes.hpp>

namespace thor_sdk::crypto {
    extern void ensure_sodium_initialized();
    extern void random_bytes(std::span<uint8_t> out);
}

#endif // !THOR_SDK_CRYPTO_RANDOM_HPP
