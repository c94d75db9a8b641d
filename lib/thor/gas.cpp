/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/gas.hpp>

namespace thor_sdk {
    uint64_t data_gas(const buffer data)
    {
        uint64_t gas = 0;
        for (const auto b: data)
            gas += b == 0 ? zero_byte_gas : non_zero_byte_gas;
        return gas;
    }

    uint64_t intrinsic_gas(const std::vector<clause> &clauses)
    {
        uint64_t gas = tx_gas;
        for (const auto &c: clauses) {
            gas += c.is_contract_creation() ? clause_gas_contract_creation : clause_gas;
            gas += data_gas(c.data);
        }
        return gas;
    }
}
