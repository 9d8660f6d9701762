//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_TRISTIMULUS_HPP
#define CHROMA_TRISTIMULUS_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <boost/config.hpp>
#include <geometrix/tensor/vector.hpp>
#include <geometrix/space/neutral_reference_frame.hpp>
#include <geometrix/tensor/index_operator_vector_access_policy.hpp>
#include <cstddef>
#include <ostream>

namespace chroma {

    //! CIE 1931 chromaticity pair.
    struct xy_chromaticity
    {
        double x;
        double y;
    };

    //! CIE 1976 UCS chromaticity pair (u', v').
    struct upvp_chromaticity
    {
        double u;
        double v;
    };

    //! Normalized chromaticity; x + y + z == 1.
    struct chromaticity
    {
        BOOST_CONSTEXPR chromaticity()
            : x{}, y{}, z{}
        {}

        BOOST_CONSTEXPR chromaticity(double x, double y, double z)
            : x{x}, y{y}, z{z}
        {}

        double operator[](std::size_t i) const { return i == 0 ? x : (i == 1 ? y : z); }
        double& operator[](std::size_t i) { return i == 0 ? x : (i == 1 ? y : z); }

        double x;
        double y;
        double z;
    };

    //! CIE XYZ tristimulus values.
    struct tristimulus
    {
        BOOST_CONSTEXPR tristimulus()
            : X{}, Y{}, Z{}
        {}

        BOOST_CONSTEXPR tristimulus(double X, double Y, double Z)
            : X{X}, Y{Y}, Z{Z}
        {}

        double operator[](std::size_t i) const { return i == 0 ? X : (i == 1 ? Y : Z); }
        double& operator[](std::size_t i) { return i == 0 ? X : (i == 1 ? Y : Z); }

        double X;
        double Y;
        double Z;
    };

    //! Weights of the red, green and blue primaries of a color system.
    struct rgb
    {
        BOOST_CONSTEXPR rgb()
            : r{}, g{}, b{}
        {}

        BOOST_CONSTEXPR rgb(double r, double g, double b)
            : r{r}, g{g}, b{b}
        {}

        double operator[](std::size_t i) const { return i == 0 ? r : (i == 1 ? g : b); }
        double& operator[](std::size_t i) { return i == 0 ? r : (i == 1 ? g : b); }

        BOOST_CONSTEXPR bool operator ==(const rgb& rhs) const BOOST_NOEXCEPT
        {
            return r == rhs.r && g == rhs.g && b == rhs.b;
        }

        BOOST_CONSTEXPR bool operator !=(const rgb& rhs) const BOOST_NOEXCEPT
        {
            return !(*this == rhs);
        }

        double r;
        double g;
        double b;
    };

    //! A chromaticity carries no luminance; scaling re-applies a brightness.
    inline tristimulus to_tristimulus(const chromaticity& c, double scale = 1.0)
    {
        return tristimulus{ c.x * scale, c.y * scale, c.z * scale };
    }

    //! Tristimulus values of a chromaticity pair at unit luminance (Y == 1).
    //! The caller guarantees y != 0.
    inline tristimulus xy_to_tristimulus(double x, double y)
    {
        return tristimulus{ x / y, 1.0, (1.0 - (x + y)) / y };
    }

    inline tristimulus operator *(const tristimulus& t, double s)
    {
        return tristimulus{ t.X * s, t.Y * s, t.Z * s };
    }

    inline tristimulus operator *(double s, const tristimulus& t)
    {
        return t * s;
    }

    inline rgb operator *(const rgb& c, double s)
    {
        return rgb{ c.r * s, c.g * s, c.b * s };
    }

    inline std::ostream& operator <<(std::ostream& os, const chromaticity& c)
    {
        return os << "{x: " << c.x << ", y: " << c.y << ", z: " << c.z << "}";
    }

    inline std::ostream& operator <<(std::ostream& os, const tristimulus& t)
    {
        return os << "{X: " << t.X << ", Y: " << t.Y << ", Z: " << t.Z << "}";
    }

    inline std::ostream& operator <<(std::ostream& os, const rgb& c)
    {
        return os << "{r: " << c.r << ", g: " << c.g << ", b: " << c.b << "}";
    }

}//! namespace chroma;

//! Make the three component color types usable as geometrix vectors (dot products, matrix products, comparisons).
#define CHROMA_DEFINE_TRIPLE_TRAITS(Triple)                                                                           \
    GEOMETRIX_DEFINE_VECTOR_TRAITS(Triple, (double), 3, double, double, neutral_reference_frame_3d,                 \
                                   index_operator_vector_access_policy<Triple>);                                     \
    namespace geometrix {                                                                                            \
        template <>                                                                                                  \
        struct construction_policy<Triple>                                                                           \
        {                                                                                                            \
            static Triple construct(const double& a, const double& b, const double& c)                               \
            {                                                                                                        \
                return Triple(a, b, c);                                                                              \
            }                                                                                                        \
                                                                                                                     \
            template <typename NumericSequence>                                                                      \
            static Triple construct(const NumericSequence& args)                                                     \
            {                                                                                                        \
                return Triple(geometrix::get<0>(args), geometrix::get<1>(args), geometrix::get<2>(args));            \
            }                                                                                                        \
        };                                                                                                           \
    }                                                                                                                \
/***/

CHROMA_DEFINE_TRIPLE_TRAITS(chroma::chromaticity)
CHROMA_DEFINE_TRIPLE_TRAITS(chroma::tristimulus)
CHROMA_DEFINE_TRIPLE_TRAITS(chroma::rgb)

#endif//CHROMA_TRISTIMULUS_HPP
