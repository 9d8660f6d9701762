//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_SPECTRAL_SOURCE_HPP
#define CHROMA_SPECTRAL_SOURCE_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <type_traits>
#include <utility>

namespace chroma {

    //! Interface for a light source with a spectral power distribution.
    //! Evaluated at wavelengths in nanometers; returns emittance in arbitrary units.
    class spectral_source
    {
    public:

        virtual ~spectral_source() = default;

        virtual double operator()(double wavelength_nm) const = 0;

    };

    //! Adapts any callable double(double) into a spectral_source.
    template <typename Fn>
    class function_spectrum : public spectral_source
    {
    public:

        explicit function_spectrum(Fn fn)
            : m_fn(std::move(fn))
        {}

        double operator()(double wavelength_nm) const override
        {
            return m_fn(wavelength_nm);
        }

    private:

        Fn m_fn;

    };

    template <typename Fn>
    inline function_spectrum<typename std::decay<Fn>::type> make_spectrum(Fn&& fn)
    {
        return function_spectrum<typename std::decay<Fn>::type>(std::forward<Fn>(fn));
    }

}//! namespace chroma;

#endif//CHROMA_SPECTRAL_SOURCE_HPP
