//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_COLOR_SYSTEM_HPP
#define CHROMA_COLOR_SYSTEM_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/exceptions.hpp>
#include <chroma/color/tristimulus.hpp>

#include <boost/config.hpp>
#include <array>
#include <string>
#include <string_view>
#include <variant>

namespace chroma {

    /*  Gamma of nonlinear correction.

        See Charles Poynton's ColorFAQ Item 45 and GammaFAQ Item 6 at:

           http://www.poynton.com/ColorFAQ.html
           http://www.poynton.com/GammaFAQ.html
    */

    //! ITU-R BT.709 piecewise transfer function.
    struct rec709_transfer
    {
        BOOST_STATIC_CONSTEXPR double threshold = 0.018;
        BOOST_STATIC_CONSTEXPR double linear_slope = 4.5;
        BOOST_STATIC_CONSTEXPR double scale = 1.099;
        BOOST_STATIC_CONSTEXPR double exponent = 0.45;
        BOOST_STATIC_CONSTEXPR double offset = 0.099;
    };

    //! Nonlinear color = (Linear color)^(1/gamma).
    struct power_law_transfer
    {
        explicit power_law_transfer(double gamma)
            : gamma(gamma)
        {
            if (!(gamma > 0.0))
                throw invalid_input("power law transfer requires a positive gamma");
        }

        double gamma;
    };

    using transfer_function = std::variant<rec709_transfer, power_law_transfer>;

    /* A color system is defined by the CIE x and y coordinates of
       its three primary illuminants and the x and y coordinates of
       the white point. The z coordinates are always derived as 1 - (x + y). */
    class color_system
    {
    public:

        color_system( std::string_view name
            , xy_chromaticity red
            , xy_chromaticity green
            , xy_chromaticity blue
            , xy_chromaticity white
            , transfer_function transfer = rec709_transfer{} )
            : m_name(name)
            , m_red(red)
            , m_green(green)
            , m_blue(blue)
            , m_white(white)
            , m_transfer(transfer)
        {}

        const std::string& name() const { return m_name; }

        const xy_chromaticity& red() const { return m_red; }
        const xy_chromaticity& green() const { return m_green; }
        const xy_chromaticity& blue() const { return m_blue; }
        const xy_chromaticity& white() const { return m_white; }
        const transfer_function& transfer() const { return m_transfer; }

        double red_z() const { return 1.0 - (m_red.x + m_red.y); }
        double green_z() const { return 1.0 - (m_green.x + m_green.y); }
        double blue_z() const { return 1.0 - (m_blue.x + m_blue.y); }
        double white_z() const { return 1.0 - (m_white.x + m_white.y); }

        //! Tristimulus value of the white point with its luminance normalized to unity.
        tristimulus white_tristimulus() const
        {
            detail::checked_denominator(m_white.y, "color system white point has zero luminance");
            return xy_to_tristimulus(m_white.x, m_white.y);
        }

    private:

        std::string       m_name;
        xy_chromaticity   m_red;
        xy_chromaticity   m_green;
        xy_chromaticity   m_blue;
        xy_chromaticity   m_white;
        transfer_function m_transfer;

    };

    /* White point chromaticities. */
    BOOST_CONSTEXPR_OR_CONST xy_chromaticity illuminant_c   { 0.3101, 0.3162 };         /* For NTSC television */
    BOOST_CONSTEXPR_OR_CONST xy_chromaticity illuminant_d65 { 0.3127, 0.3291 };         /* For EBU and SMPTE */
    BOOST_CONSTEXPR_OR_CONST xy_chromaticity illuminant_e   { 0.33333333, 0.33333333 }; /* CIE equal-energy illuminant */

    namespace color_systems {

        #define CHROMA_DEFINE_COLOR_SYSTEM(fn, friendlyName, xRed, yRed, xGreen, yGreen, xBlue, yBlue, white) \
            inline const color_system& fn()                                                                    \
            {                                                                                                  \
                static const color_system cs{ friendlyName                                                     \
                    , xy_chromaticity{ xRed, yRed }                                                            \
                    , xy_chromaticity{ xGreen, yGreen }                                                        \
                    , xy_chromaticity{ xBlue, yBlue }                                                          \
                    , white                                                                                    \
                    , rec709_transfer{} };                                                                     \
                return cs;                                                                                     \
            }                                                                                                  \
        /***/

        //!                         Name                 xRed    yRed    xGreen  yGreen  xBlue   yBlue   White point
        CHROMA_DEFINE_COLOR_SYSTEM( ntsc,   "NTSC",            0.67,   0.33,   0.21,   0.71,   0.14,   0.08,   illuminant_c )
        CHROMA_DEFINE_COLOR_SYSTEM( ebu,    "EBU (PAL/SECAM)", 0.64,   0.33,   0.29,   0.60,   0.15,   0.06,   illuminant_d65 )
        CHROMA_DEFINE_COLOR_SYSTEM( smpte,  "SMPTE",           0.630,  0.340,  0.310,  0.595,  0.155,  0.070,  illuminant_d65 )
        CHROMA_DEFINE_COLOR_SYSTEM( hdtv,   "HDTV",            0.670,  0.330,  0.210,  0.710,  0.150,  0.060,  illuminant_d65 )
        CHROMA_DEFINE_COLOR_SYSTEM( cie,    "CIE",             0.7355, 0.2645, 0.2658, 0.7243, 0.1669, 0.0085, illuminant_e )
        CHROMA_DEFINE_COLOR_SYSTEM( rec709, "CIE REC 709",     0.64,   0.33,   0.30,   0.60,   0.15,   0.06,   illuminant_d65 )

        #undef CHROMA_DEFINE_COLOR_SYSTEM

        //! All preset systems in registry order.
        inline const std::array<const color_system*, 6>& all()
        {
            static const std::array<const color_system*, 6> systems = { &ntsc(), &ebu(), &smpte(), &hdtv(), &cie(), &rec709() };
            return systems;
        }

    }//! namespace color_systems;

    //! Look up a preset by its name (e.g. "SMPTE"). Returns nullptr when no preset matches.
    inline const color_system* find_color_system(std::string_view name)
    {
        for (const color_system* cs : color_systems::all())
            if (cs->name() == name)
                return cs;
        return nullptr;
    }

    inline const color_system& get_color_system(std::string_view name)
    {
        if (const color_system* cs = find_color_system(name))
            return *cs;
        throw invalid_input("unknown color system: " + std::string(name));
    }

}//! namespace chroma;

#endif//CHROMA_COLOR_SYSTEM_HPP
