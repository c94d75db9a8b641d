/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/common/test.hpp>
#include <thor/gas.hpp>
#include <thor/test-vectors.hpp>

using namespace thor_sdk;

suite gas_suite = [] {
    "gas"_test = [] {
        "data gas"_test = [] {
            test_same(uint64_t { 0 }, data_gas(uint8_vector {}));
            test_same(uint64_t { 4 }, data_gas(uint8_vector { 0x00 }));
            test_same(uint64_t { 68 }, data_gas(uint8_vector { 0x01 }));
            test_same(uint64_t { 3 * 4 + 3 * 68 }, data_gas(uint8_vector::from_hex("000000606060")));
        };
        "no clauses"_test = [] {
            test_same(uint64_t { 5000 }, intrinsic_gas({}));
        };
        "transfer"_test = [] {
            test_same(uint64_t { 21000 }, intrinsic_gas({ clause::transfer(test::reference_to(), 1) }));
            test_same(uint64_t { 37000 }, intrinsic_gas({ clause::transfer(test::reference_to(), 1), clause::transfer(test::reference_to(), 2) }));
        };
        "contract creation"_test = [] {
            test_same(uint64_t { 5000 + 48000 + 68 * 2 }, intrinsic_gas({ clause::deploy(uint8_vector { 0x60, 0x60 }) }));
            test_same(uint64_t { 5000 + 48000 + 16000 + 4 + 68 },
                intrinsic_gas({ clause::deploy(uint8_vector { 0x00, 0x01 }), clause::transfer(test::reference_to(), 0) }));
        };
        "reference clauses"_test = [] {
            test_same(uint64_t { 37432 }, intrinsic_gas(test::reference_clauses()));
        };
    };
};
