//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_GAMUT_HPP
#define CHROMA_GAMUT_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/tristimulus.hpp>
#include <algorithm>

namespace chroma {

    /*                            INSIDE_GAMUT

         Test whether a requested colour is within the gamut
         achievable with the primaries of the current colour
         system.  This amounts simply to testing whether all the
         primary weights are non-negative. */
    inline bool inside_gamut(double r, double g, double b)
    {
        return (r >= 0) && (g >= 0) && (b >= 0);
    }

    inline bool inside_gamut(const rgb& c)
    {
        return inside_gamut(c.r, c.g, c.b);
    }

    /*                          CONSTRAIN_RGB

        If the requested RGB shade contains a negative weight for
        one of the primaries, it lies outside the colour gamut
        accessible from the given triple of primaries.  Desaturate
        it by adding white, equal quantities of R, G, and B, enough
        to make RGB all positive.  Returns true if the components
        were modified.
    */
    inline bool constrain_rgb(rgb& c)
    {
        /* Amount of white needed is w = - min(0, r, g, b) */
        double w = -(std::min)({ 0.0, c.r, c.g, c.b });

        if (w > 0) {
            c.r += w;  c.g += w;  c.b += w;
            return true;
        }

        return false;
    }

    inline rgb constrain_rgb(double r, double g, double b)
    {
        rgb c{ r, g, b };
        constrain_rgb(c);
        return c;
    }

    /*                          NORM_RGB

        Normalise RGB components so the most intense (unless all
        are zero) has a value of 1.
    */
    inline rgb norm_rgb(double r, double g, double b)
    {
        double greatest = (std::max)({ r, g, b });
        if (greatest > 0)
            return rgb{ r / greatest, g / greatest, b / greatest };
        return rgb{ r, g, b };
    }

    inline rgb norm_rgb(const rgb& c)
    {
        return norm_rgb(c.r, c.g, c.b);
    }

}//! namespace chroma;

#endif//CHROMA_GAMUT_HPP
