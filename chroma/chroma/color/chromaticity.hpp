//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_CHROMATICITY_HPP
#define CHROMA_CHROMATICITY_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/exceptions.hpp>
#include <chroma/color/tristimulus.hpp>

namespace chroma {

    /*                          UPVP_TO_XY
        Given 1976 coordinates u', v', determine 1931 chromaticities x, y
    */
    inline xy_chromaticity upvp_to_xy(double up, double vp)
    {
        auto d = detail::checked_denominator((6 * up) - (16 * vp) + 12, "upvp_to_xy: u', v' lie on the singular line of the transform");
        return xy_chromaticity{ (9 * up) / d, (4 * vp) / d };
    }

    inline xy_chromaticity upvp_to_xy(const upvp_chromaticity& c)
    {
        return upvp_to_xy(c.u, c.v);
    }

    /*                          XY_TO_UPVP
        Given 1931 chromaticities x, y, determine 1976 coordinates u', v'
    */
    inline upvp_chromaticity xy_to_upvp(double xc, double yc)
    {
        auto d = detail::checked_denominator((-2 * xc) + (12 * yc) + 3, "xy_to_upvp: x, y lie on the singular line of the transform");
        return upvp_chromaticity{ (4 * xc) / d, (9 * yc) / d };
    }

    inline upvp_chromaticity xy_to_upvp(const xy_chromaticity& c)
    {
        return xy_to_upvp(c.x, c.y);
    }

}//! namespace chroma;

#endif//CHROMA_CHROMATICITY_HPP
