//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_XYZ_TO_RGB_HPP
#define CHROMA_XYZ_TO_RGB_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/color_system.hpp>
#include <chroma/color/exceptions.hpp>
#include <chroma/color/tristimulus.hpp>

#include <geometrix/tensor/matrix.hpp>
#include <geometrix/tensor/vector.hpp>
#include <geometrix/algebra/expression.hpp>
#include <geometrix/algebra/algebra.hpp>
#include <geometrix/arithmetic/vector.hpp>

#include <array>
#include <cstddef>

namespace chroma {

    /*                             XYZ_TO_RGB

        Given an additive tricolour system CS, defined by the CIE x
        and y chromaticities of its three primaries (z is derived
        trivially as 1-(x+y)), and a desired chromaticity (XC, YC,
        ZC) in CIE space, determine the contribution of each
        primary in a linear combination which sums to the desired
        chromaticity.  If the  requested chromaticity falls outside
        the Maxwell  triangle (colour gamut) formed by the three
        primaries, one of the r, g, or b weights will be negative.

        Caller can use constrain_rgb() to desaturate an
        outside-gamut colour to the closest representation within
        the available gamut and/or norm_rgb to normalise the RGB
        components so the largest nonzero component has value 1.
    */
    class rgb_transform
    {
    public:

        using vector3 = geometrix::vector<double, 3>;
        using matrix3 = geometrix::matrix<double, 3, 3>;

        explicit rgb_transform(const color_system& cs)
            : m_matrix(make_matrix(cs))
        {}

        rgb operator()(const tristimulus& xyz) const
        {
            return geometrix::construct<rgb>(m_matrix * xyz);
        }

        rgb operator()(double xc, double yc, double zc) const
        {
            return (*this)(tristimulus{ xc, yc, zc });
        }

        vector3 row(std::size_t i) const { return vector3{ m_matrix[i][0], m_matrix[i][1], m_matrix[i][2] }; }
        const matrix3& matrix() const { return m_matrix; }

    private:

        static matrix3 make_matrix(const color_system& cs)
        {
            using namespace geometrix;

            double xr = cs.red().x;    double yr = cs.red().y;    double zr = cs.red_z();
            double xg = cs.green().x;  double yg = cs.green().y;  double zg = cs.green_z();
            double xb = cs.blue().x;   double yb = cs.blue().y;   double zb = cs.blue_z();

            /* xyz -> rgb matrix, before scaling to white. Each row is the cross product of the other two primaries. */
            std::array<vector3, 3> rows =
            {
                  vector3{ (yg * zb) - (yb * zg), (xb * zg) - (xg * zb), (xg * yb) - (xb * yg) }
                , vector3{ (yb * zr) - (yr * zb), (xr * zb) - (xb * zr), (xb * yr) - (xr * yb) }
                , vector3{ (yr * zg) - (yg * zr), (xg * zr) - (xr * zg), (xr * yg) - (xg * yr) }
            };

            /* Determinant of the primaries; rounding leaves collinear primaries a few ulps from zero. */
            auto red = vector3{ xr, yr, zr };
            auto green = vector3{ xg, yg, zg };
            auto blue = vector3{ xb, yb, zb };
            detail::checked_pivot(dot_product(red, rows[0]), magnitude(red) * magnitude(green) * magnitude(blue), "xyz_to_rgb: primaries are collinear");

            /* White scaling factors.
               Dividing by yw scales the white luminance to unity, as conventional. */
            auto yw = detail::checked_denominator(cs.white().y, "xyz_to_rgb: white point has zero luminance");
            auto white = vector3{ cs.white().x, yw, cs.white_z() };

            for (auto& row : rows)
            {
                auto w = detail::checked_pivot(dot_product(row, white), magnitude(row) * magnitude(white), "xyz_to_rgb: white point lies on a gamut edge") / yw;
                row = vector3{ row[0] / w, row[1] / w, row[2] / w };
            }

            return matrix3{ rows[0][0], rows[0][1], rows[0][2]
                          , rows[1][0], rows[1][1], rows[1][2]
                          , rows[2][0], rows[2][1], rows[2][2] };
        }

        matrix3 m_matrix;

    };

    inline rgb xyz_to_rgb(const color_system& cs, const tristimulus& xyz)
    {
        return rgb_transform{ cs }(xyz);
    }

    inline rgb xyz_to_rgb(const color_system& cs, double xc, double yc, double zc)
    {
        return rgb_transform{ cs }(xc, yc, zc);
    }

    inline rgb xyz_to_rgb(const color_system& cs, const chromaticity& c)
    {
        return rgb_transform{ cs }(c.x, c.y, c.z);
    }

}//! namespace chroma;

#endif//CHROMA_XYZ_TO_RGB_HPP
