//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_GAMMA_CORRECT_HPP
#define CHROMA_GAMMA_CORRECT_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/color_system.hpp>
#include <chroma/color/exceptions.hpp>
#include <chroma/color/tristimulus.hpp>

#include <cmath>
#include <variant>

namespace chroma {

    namespace detail {

        struct transfer_encoder
        {
            double c;

            double operator()(const rec709_transfer&) const
            {
                using t = rec709_transfer;
                if (c < t::threshold)
                    return c * t::linear_slope;
                return (t::scale * std::pow(c, t::exponent)) - t::offset;
            }

            double operator()(const power_law_transfer& t) const
            {
                if (c < 0)
                    throw domain_error("gamma_correct: negative value under a power law transfer");
                return std::pow(c, 1.0 / t.gamma);
            }
        };

        struct transfer_decoder
        {
            double v;

            double operator()(const rec709_transfer&) const
            {
                using t = rec709_transfer;
                if (v < t::threshold * t::linear_slope)
                    return v / t::linear_slope;
                return std::pow((v + t::offset) / t::scale, 1.0 / t::exponent);
            }

            double operator()(const power_law_transfer& t) const
            {
                if (v < 0)
                    throw domain_error("gamma_expand: negative value under a power law transfer");
                return std::pow(v, t.gamma);
            }
        };

    }//! namespace detail;

    /*                          GAMMA_CORRECT_RGB

        Transform linear RGB values to nonlinear RGB values. Rec.
        709 is ITU-R Recommendation BT. 709 (1990) ``Basic
        Parameter Values for the HDTV Standard for the Studio and
        for International Programme Exchange'', formerly CCIR Rec.
        709. For details see

           http://www.poynton.com/ColorFAQ.html
           http://www.poynton.com/GammaFAQ.html

        No clamping is performed; inputs are expected to be constrained and normalized.
    */
    inline double gamma_correct(const color_system& cs, double c)
    {
        return std::visit(detail::transfer_encoder{ c }, cs.transfer());
    }

    inline rgb gamma_correct_rgb(const color_system& cs, const rgb& c)
    {
        return rgb{ gamma_correct(cs, c.r), gamma_correct(cs, c.g), gamma_correct(cs, c.b) };
    }

    //! Inverse of gamma_correct: nonlinear signal back to linear light.
    inline double gamma_expand(const color_system& cs, double v)
    {
        return std::visit(detail::transfer_decoder{ v }, cs.transfer());
    }

    inline rgb gamma_expand_rgb(const color_system& cs, const rgb& c)
    {
        return rgb{ gamma_expand(cs, c.r), gamma_expand(cs, c.g), gamma_expand(cs, c.b) };
    }

}//! namespace chroma;

#endif//CHROMA_GAMMA_CORRECT_HPP
