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

#include <chroma/color/gamma_correct.hpp>

#include <cmath>

namespace {

    const chroma::color_system& gamma22_system()
    {
        static const chroma::color_system cs{ "gamma 2.2", { 0.64, 0.33 }, { 0.30, 0.60 }, { 0.15, 0.06 }, chroma::illuminant_d65, chroma::power_law_transfer{ 2.2 } };
        return cs;
    }

}//! namespace;

TEST(gamma_correct_test_suite, rec709_linear_segment)
{
    using namespace chroma;

    const auto& cs = color_systems::rec709();
    EXPECT_DOUBLE_EQ(0.0, gamma_correct(cs, 0.0));
    EXPECT_NEAR(0.045, gamma_correct(cs, 0.01), 1e-15);
}

TEST(gamma_correct_test_suite, rec709_power_segment)
{
    using namespace chroma;

    const auto& cs = color_systems::smpte();
    EXPECT_NEAR(0.7055150899221212, gamma_correct(cs, 0.5), 1e-12);
    EXPECT_NEAR(1.0, gamma_correct(cs, 1.0), 1e-12);
    EXPECT_NEAR(1.099 * std::pow(0.018, 0.45) - 0.099, gamma_correct(cs, 0.018), 1e-12);
}

TEST(gamma_correct_test_suite, rec709_is_monotonic)
{
    using namespace chroma;

    const auto& cs = color_systems::hdtv();
    double last = gamma_correct(cs, 0.0);
    for (int i = 1; i <= 100; ++i)
    {
        double v = gamma_correct(cs, i / 100.0);
        EXPECT_GT(v, last);
        last = v;
    }
}

TEST(gamma_correct_test_suite, power_law_correction)
{
    using namespace chroma;

    const auto& cs = gamma22_system();
    EXPECT_NEAR(0.7297400528407231, gamma_correct(cs, 0.5), 1e-12);
    for (int i = 1; i <= 10; ++i)
    {
        double c = i / 10.0;
        EXPECT_NEAR(c, std::pow(gamma_correct(cs, c), 2.2), 1e-6);
    }
}

TEST(gamma_correct_test_suite, power_law_rejects_negative)
{
    using namespace chroma;

    EXPECT_THROW(gamma_correct(gamma22_system(), -0.1), domain_error);
    EXPECT_THROW(gamma_expand(gamma22_system(), -0.1), domain_error);
}

TEST(gamma_correct_test_suite, expand_inverts_correct)
{
    using namespace chroma;

    for (const color_system* cs : { &color_systems::rec709(), &gamma22_system() })
    {
        for (int i = 0; i <= 50; ++i)
        {
            double c = i / 50.0;
            EXPECT_NEAR(c, gamma_expand(*cs, gamma_correct(*cs, c)), 1e-9) << cs->name() << " at " << c;
        }
    }
}

TEST(gamma_correct_test_suite, correct_rgb_applies_per_channel)
{
    using namespace chroma;

    const auto& cs = color_systems::ebu();
    auto c = gamma_correct_rgb(cs, rgb{ 0.01, 0.5, 1.0 });
    EXPECT_NEAR(gamma_correct(cs, 0.01), c.r, 1e-15);
    EXPECT_NEAR(gamma_correct(cs, 0.5), c.g, 1e-15);
    EXPECT_NEAR(gamma_correct(cs, 1.0), c.b, 1e-15);

    auto d = gamma_expand_rgb(cs, c);
    EXPECT_NEAR(0.01, d.r, 1e-9);
    EXPECT_NEAR(0.5, d.g, 1e-9);
    EXPECT_NEAR(1.0, d.b, 1e-9);
}
