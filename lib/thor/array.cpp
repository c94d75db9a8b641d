/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
}
#include <thor/array.hpp>

namespace thor_sdk {
    void secure_clear(const std::span<uint8_t> store)
    {
        // sodium_memzero is not optimized away even when the storage dies right after
        sodium_memzero(store.data(), store.size());
    }
}
