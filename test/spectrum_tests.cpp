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

#include <chroma/color/blackbody.hpp>
#include <chroma/color/cie_color_match.hpp>
#include <chroma/color/spectrum_to_xyz.hpp>
#include "color_test_utils.hpp"

#include <cmath>
#include <limits>
#include <vector>

TEST(spectrum_test_suite, color_match_table_layout)
{
    using namespace chroma;

    EXPECT_EQ(81u, cie_color_match::table().size());
    EXPECT_DOUBLE_EQ(380.0, cie_color_match::wavelength(0));
    EXPECT_DOUBLE_EQ(555.0, cie_color_match::wavelength(35));
    EXPECT_DOUBLE_EQ(780.0, cie_color_match::wavelength(80));
    EXPECT_DOUBLE_EQ(1.0, cie_color_match::get_value(35, cie_color_match::Y));
    EXPECT_DOUBLE_EQ(0.0065, cie_color_match::get_value(0, cie_color_match::Z));
    EXPECT_DOUBLE_EQ(0.0, cie_color_match::get_value(80, cie_color_match::X));
}

TEST(spectrum_test_suite, samples_every_five_nanometers)
{
    using namespace chroma;

    std::vector<double> sampled;
    spectrum_to_tristimulus([&sampled](double wl) { sampled.push_back(wl); return 1.0; });

    ASSERT_EQ(81u, sampled.size());
    for (std::size_t i = 0; i < sampled.size(); ++i)
        EXPECT_DOUBLE_EQ(380.0 + 5.0 * i, sampled[i]);
}

TEST(spectrum_test_suite, equal_energy_spectrum_sums_table)
{
    using namespace chroma;

    auto t = spectrum_to_tristimulus([](double) { return 1.0; });
    EXPECT_NEAR(21.3714, t.X, 1e-9);
    EXPECT_NEAR(21.3711, t.Y, 1e-9);
    EXPECT_NEAR(21.3715, t.Z, 1e-9);

    auto c = spectrum_to_xyz(make_spectrum([](double) { return 2.5; }));
    EXPECT_NEAR(0.33333437314783015, c.x, 1e-12);
    EXPECT_NEAR(0.33332969398259327, c.y, 1e-12);
}

TEST(spectrum_test_suite, chromaticity_sums_to_one)
{
    using namespace chroma;

    for (double kelvin : { 1200.0, 3300.0, 6500.0, 25000.0 })
    {
        auto c = spectrum_to_xyz(bb_spectrum(kelvin));
        EXPECT_NEAR(1.0, c.x + c.y + c.z, 1e-9);
    }

    auto c = spectrum_to_xyz(make_spectrum([](double wl) { return wl > 600.0 ? 1.0 : 0.0; }));
    EXPECT_NEAR(1.0, c.x + c.y + c.z, 1e-9);
}

TEST(spectrum_test_suite, luminance_scale_is_discarded)
{
    using namespace chroma;
    using namespace geometrix;

    blackbody_spectrum bb{ 4000.0 };
    auto a = spectrum_to_xyz(bb);
    auto b = spectrum_to_xyz([&bb](double wl) { return 1000.0 * bb(wl); });

    test::cmp_policy cmp(1e-12);
    EXPECT_TRUE(numeric_sequence_equals(a, b, cmp));
}

TEST(spectrum_test_suite, dark_spectrum_throws)
{
    using namespace chroma;

    EXPECT_THROW(spectrum_to_xyz([](double) { return 0.0; }), divide_by_zero);
    EXPECT_THROW(spectrum_to_xyz(make_spectrum([](double) { return 0.0; })), domain_error);
}

TEST(spectrum_test_suite, abstract_source_through_base_reference)
{
    using namespace chroma;
    using namespace geometrix;

    blackbody_spectrum bb{ 6500.0 };
    const spectral_source& source = bb;

    test::cmp_policy cmp(1e-15);
    EXPECT_TRUE(numeric_sequence_equals(spectrum_to_xyz(source), spectrum_to_xyz(bb), cmp));
}

TEST(blackbody_test_suite, planck_emittance)
{
    using namespace chroma;

    auto bb = bb_spectrum(5000.0);
    EXPECT_NEAR(3.9936358087493e13, bb(550.0), 1e2);
    EXPECT_DOUBLE_EQ(5000.0, bb.temperature());
}

TEST(blackbody_test_suite, peak_follows_wien_displacement)
{
    using namespace chroma;

    // Wien: peak at ~2.898e6 nm K / T; 5800K peaks near 500nm.
    blackbody_spectrum bb{ 5800.0 };
    EXPECT_GT(bb(500.0), bb(400.0));
    EXPECT_GT(bb(500.0), bb(700.0));
}

TEST(blackbody_test_suite, construct_from_units)
{
    using namespace chroma;

    blackbody_spectrum bb{ 5000.0 * units::kelvin };
    EXPECT_DOUBLE_EQ(5000.0, bb.temperature());

    units::length wl = 550e-9 * units::meters;
    EXPECT_NEAR(bb(550.0), bb(wl), bb(550.0) * 1e-9);

    units::wavelength nm = 550.0 * units::nanometers;
    EXPECT_NEAR(550.0, units::to_nanometers(units::length(nm)), 1e-9);
}

TEST(blackbody_test_suite, non_physical_input_throws)
{
    using namespace chroma;

    EXPECT_THROW(blackbody_spectrum{ 0.0 }, invalid_input);
    EXPECT_THROW(blackbody_spectrum{ -300.0 }, invalid_input);
    EXPECT_THROW(bb_spectrum(-1.0 * units::kelvin), invalid_input);

    blackbody_spectrum bb{ 3000.0 };
    EXPECT_THROW(bb(0.0), invalid_input);
    EXPECT_THROW(bb(-550.0), invalid_input);
}

TEST(blackbody_test_suite, very_hot_body_stays_finite)
{
    using namespace chroma;

    // Rayleigh-Jeans limit: exp(c2 / (wl * T)) - 1 would round to zero.
    for (double kelvin : { 1e21, 1e30 })
    {
        auto c = spectrum_to_xyz(bb_spectrum(kelvin));
        EXPECT_NEAR(0.2399, c.x, 1e-4) << kelvin;
        EXPECT_NEAR(0.2341, c.y, 1e-4) << kelvin;
        EXPECT_NEAR(1.0, c.x + c.y + c.z, 1e-9) << kelvin;
    }
}

TEST(blackbody_test_suite, overflowing_emittance_throws)
{
    using namespace chroma;

    blackbody_spectrum bb{ 1e305 };
    EXPECT_THROW(bb(550.0), invalid_input);
    EXPECT_THROW(spectrum_to_xyz(bb), invalid_input);
}

TEST(spectrum_test_suite, non_finite_spectrum_throws)
{
    using namespace chroma;

    auto inf = std::numeric_limits<double>::infinity();
    auto nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(spectrum_to_xyz([inf](double) { return inf; }), domain_error);
    EXPECT_THROW(spectrum_to_xyz([nan](double) { return nan; }), domain_error);
    EXPECT_THROW(spectrum_to_xyz([inf](double wl) { return wl == 550.0 ? inf : 1.0; }), domain_error);
}
