/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/big_int.hpp>
#include <thor/common/test.hpp>

using namespace thor_sdk;

suite big_int_suite = [] {
    "big_int"_test = [] {
        "zero is the empty string"_test = [] {
            expect(big_int_to_bytes(0).empty());
            test_same(cpp_int { 0 }, big_int_from_bytes(uint8_vector {}));
        };
        "minimal big-endian"_test = [] {
            test_same(uint8_vector { 0x27, 0x10 }, big_int_to_bytes(10000));
            test_same(uint8_vector { 0x80 }, big_int_to_bytes(128));
            test_same(cpp_int { 12345678 }, big_int_from_bytes(uint8_vector { 0xBC, 0x61, 0x4E }));
        };
        "256-bit"_test = [] {
            const cpp_int max = (cpp_int { 1 } << 256) - 1;
            const auto bytes = big_int_to_bytes(max);
            expect(bytes.size() == 32U);
            test_same(max, big_int_from_bytes(bytes));
            expect(throws([] { big_int_from_bytes(uint8_vector(33)); }));
            expect(throws([] { big_int_to_bytes(-1); }));
        };
        "from_string"_test = [] {
            test_same(cpp_int { 1000 }, big_int_from_string("1000"));
            test_same(cpp_int { 0xABCD }, big_int_from_string("0xabcd"));
            test_same(cpp_int { 0 }, big_int_from_string("0"));
            expect(throws([] { big_int_from_string(""); }));
            expect(throws([] { big_int_from_string("0x"); }));
            expect(throws([] { big_int_from_string("12a"); }));
            expect(throws([] { big_int_from_string("-5"); }));
        };
        "formatted"_test = [] {
            test_same(std::string { "340282366920938463463374607431768211456" }, fmt::format("{}", cpp_int { cpp_int { 1 } << 128 }));
        };
    };
};
