/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_GAS_HPP
#define THOR_SDK_GAS_HPP

#include <thor/clause.hpp>

namespace thor_sdk {
    static constexpr uint64_t tx_gas = 5000;
    static constexpr uint64_t clause_gas = 16000;
    static constexpr uint64_t clause_gas_contract_creation = 48000;
    static constexpr uint64_t zero_byte_gas = 4;
    static constexpr uint64_t non_zero_byte_gas = 68;

    extern uint64_t data_gas(buffer data);
    // The minimum gas charged before any execution; recomputed whenever the clause list changes
    extern uint64_t intrinsic_gas(const std::vector<clause> &clauses);
}

#endif // !THOR_SDK_GAS_HPP
