/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_COMMON_TEST_HPP
#define THOR_SDK_COMMON_TEST_HPP

#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <thor/common/bytes.hpp>
#include <thor/common/format.hpp>

namespace thor_sdk {
    using namespace boost::ut;

    // prints byte sequences as hex in failure reports
    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer &operator<<(T &&t)
        {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>)
                std::cerr << fmt::format("{}", std::span<const uint8_t> { t });
            else
                std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer &operator<<(const std::string_view sv)
        {
            std::cerr << sv;
            return *this;
        }
    };

    // the expected value goes first, the failure report shows both values
    template<typename X, typename Y>
        requires requires (const Y &y) { static_cast<X>(y); }
    bool test_same(const X &expected, const Y &actual, const std::source_location &loc=std::source_location::current())
    {
        const auto res = expected == static_cast<X>(actual);
        expect(res, loc) << fmt::format("expected {} got {}", expected, actual);
        return res;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<thor_sdk::test_printer>> {};

#endif // !THOR_SDK_COMMON_TEST_HPP
