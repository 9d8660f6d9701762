//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <chroma/utility/color.hpp>

#include <limits>

TEST(color_test_suite, construct_color)
{
    using namespace chroma;

    auto c = color_rgba{255, 0, 0};
    EXPECT_EQ(c, make_color(255, 0, 0, 255));
    EXPECT_NE(c, make_color(255, 0, 0, 128));
}

TEST(color_test_suite, access_channels)
{
    using namespace chroma;

    auto c = color_rgba{255, 128, 7};
    EXPECT_EQ(255, c.red);
    EXPECT_EQ(128, c.green);
    EXPECT_EQ(7, c.blue);
    EXPECT_EQ(255, c.alpha);
    EXPECT_EQ(128, c[1]);
    EXPECT_EQ(255, c[3]);
}

TEST(color_test_suite, quantize_truncates)
{
    using namespace chroma;

    EXPECT_EQ(color_rgba(255, 127, 0), to_color_rgba(rgb{ 1.0, 0.5, 0.0 }));
    EXPECT_EQ(color_rgba(0, 1, 254), to_color_rgba(rgb{ 0.0039, 0.0040, 0.999 }));
}

TEST(color_test_suite, quantize_clamps_out_of_range_channels)
{
    using namespace chroma;

    EXPECT_EQ(color_rgba(0, 255, 255, 10), to_color_rgba(rgb{ -0.3, 1.2, 7.0 }, 10));
}

TEST(color_test_suite, quantize_rejects_nan)
{
    using namespace chroma;

    EXPECT_THROW(to_color_rgba(rgb{ 0.5, std::numeric_limits<double>::quiet_NaN(), 0.5 }), domain_error);
}
