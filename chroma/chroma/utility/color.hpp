//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_UTILITY_COLOR_HPP
#define CHROMA_UTILITY_COLOR_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/exceptions.hpp>
#include <chroma/color/tristimulus.hpp>

#include <boost/config.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <ostream>

namespace chroma {

    //! Type to represent a 24-bit color with an alpha channel in rgba format, as handed to 8-bit display drivers.
    struct color_rgba
    {
        BOOST_CONSTEXPR color_rgba()
            : red{}, green{}, blue{}, alpha{}
        {}

        BOOST_CONSTEXPR color_rgba(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255)
            : red{r}
            , green{g}
            , blue{b}
            , alpha{a}
        {}

        BOOST_CONSTEXPR bool operator ==(const color_rgba& rhs) const BOOST_NOEXCEPT
        {
            return red == rhs.red && green == rhs.green && blue == rhs.blue && alpha == rhs.alpha;
        }

        BOOST_CONSTEXPR bool operator !=(const color_rgba& rhs) const BOOST_NOEXCEPT
        {
            return !(*this == rhs);
        }

        BOOST_CONSTEXPR std::uint8_t operator[](std::size_t index) const BOOST_NOEXCEPT
        {
            return index == 0 ? red : (index == 1 ? green : (index == 2 ? blue : alpha));
        }

        std::uint8_t red;
        std::uint8_t green;
        std::uint8_t blue;
        std::uint8_t alpha;
    };

    static_assert(sizeof(color_rgba)==4, "color_rgba should be packed in 4 bytes.");

    template <typename ...Args>
    inline BOOST_CONSTEXPR color_rgba make_color(Args... a)
    {
        return color_rgba(a...);
    }

    namespace detail {
        inline std::uint8_t quantize_channel(double v)
        {
            if (std::isnan(v))
                throw domain_error("to_color_rgba: channel is not a number");
            v = (std::min)((std::max)(v, 0.0), 1.0);
            return static_cast<std::uint8_t>(v * 255.0);
        }
    }//! namespace detail;

    //! Clamp each channel to [0,1] and truncate to 8 bits. Throws domain_error for a NaN channel.
    inline color_rgba to_color_rgba(const rgb& c, std::uint8_t alpha = 255)
    {
        return color_rgba(detail::quantize_channel(c.r), detail::quantize_channel(c.g), detail::quantize_channel(c.b), alpha);
    }

    inline std::ostream& operator <<(std::ostream& os, const color_rgba& c)
    {
        return os << "{" << static_cast<int>(c.red) << ", " << static_cast<int>(c.green) << ", " << static_cast<int>(c.blue) << ", " << static_cast<int>(c.alpha) << "}";
    }

}//! namespace chroma;

#endif//CHROMA_UTILITY_COLOR_HPP
