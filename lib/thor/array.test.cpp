/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstring>
#include <thor/array.hpp>
#include <thor/common/test.hpp>

using namespace thor_sdk;

suite array_suite = [] {
    "array"_test = [] {
        "initialize empty"_test = [] {
            byte_array<4> a {};
            expect(a.size() == 4);
            for (auto v: a)
                expect(v == 0) << v;
        };
        "initialize"_test = [] {
            byte_array<4> a { 1, 2, 3, 4 };
            expect(a[0] == 1);
            expect(a[3] == 4);
            expect(throws([] { [[maybe_unused]] const byte_array<4> b { 1, 2, 3 }; }));
        };
        "construct_span"_test = [] {
            const byte_array<4> b { 9, 8, 7, 6 };
            const byte_array<4> c { static_cast<buffer>(b) };
            expect(c[0] == 9);
            expect(c[3] == 6);
            test_same(b, c);
        };
        "assign_buffer"_test = [] {
            byte_array<4> a { 1, 2, 3, 4 };
            const uint8_vector v { 9, 8, 7, 6 };
            a = static_cast<buffer>(v);
            expect(a[0] == 9);
            expect(a[3] == 6);
            expect(throws([&] { a = buffer { v.data(), 3 }; }));
        };
        "from_hex"_test = [] {
            const auto a = byte_array<4>::from_hex("0xf0E1d2c3");
            expect(a[0] == 0xF0);
            expect(a[1] == 0xE1);
            expect(throws([] { byte_array<4>::from_hex("f0e1d2"); }));
            expect(throws([] { byte_array<4>::from_hex("f0e1d2zz"); }));
        };
        "formatted as lowercase hex"_test = [] {
            const auto data = byte_array<4>::from_hex("F0E1D2C3");
            test_same(std::string { "f0e1d2c3" }, fmt::format("{}", data));
            test_same(std::string { "0xf0e1d2c3" }, to_hex_0x(data));
        };
        "secure_array"_test = [] {
            const auto filled = byte_array<4>::from_hex("DEADBEAF");
            byte_array<4> data = filled;
            secure_clear(std::span<uint8_t> { data.data(), data.size() });
            test_same(byte_array<4> {}, data);
            const secure_byte_array<4> key = secure_byte_array<4>::from_hex("DEADBEAF");
            expect(memcmp(key.data(), filled.data(), filled.size()) == 0);
        };
    };
    "uint8_vector"_test = [] {
        "from_hex"_test = [] {
            const auto v = bytes_from_hex("0x000102");
            expect(v.size() == 3U);
            expect(v[2] == 2);
            expect(throws([] { bytes_from_hex("0x001"); }));
            expect(bytes_from_hex("0x").empty());
        };
        "is_hex_0x"_test = [] {
            expect(is_hex_0x("0x"));
            expect(is_hex_0x("0xABcd"));
            expect(!is_hex_0x("abcd"));
            expect(!is_hex_0x("0xabc"));
            expect(!is_hex_0x("0xabcg"));
        };
        "compare"_test = [] {
            const uint8_vector a { 1, 2 };
            const uint8_vector b { 1, 2, 3 };
            expect(a < b);
            expect(a == static_cast<buffer>(b).subbuf(0, 2));
            expect(throws([&] { static_cast<buffer>(a).subbuf(1, 2); }));
        };
    };
};
