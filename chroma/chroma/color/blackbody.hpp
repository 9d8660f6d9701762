//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_BLACKBODY_HPP
#define CHROMA_BLACKBODY_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/exceptions.hpp>
#include <chroma/color/spectral_source.hpp>
#include <chroma/units/boost_units.hpp>

#include <boost/config.hpp>
#include <cmath>

namespace chroma {

    //! BB_SPECTRUM
    //!  Calculate, by Planck's radiation law, the emittance of a black body
    //!  of a given temperature at the given wavelength.
    class blackbody_spectrum : public spectral_source
    {
    public:

        BOOST_STATIC_CONSTEXPR double first_radiation_constant = 3.74183e-16; //! 2*pi*h*c^2 (W m^2)
        BOOST_STATIC_CONSTEXPR double second_radiation_constant = 1.4388e-2;  //! h*c/k (m K)

        explicit blackbody_spectrum(double kelvin)
            : m_temperature(kelvin)
        {
            if (!(kelvin > 0.0))
                throw invalid_input("blackbody_spectrum: temperature must be above absolute zero");
        }

        explicit blackbody_spectrum(const units::temperature& t)
            : blackbody_spectrum(units::to_kelvin(t))
        {}

        double temperature() const { return m_temperature; }

        double operator()(double wavelength_nm) const override
        {
            if (!(wavelength_nm > 0.0))
                throw invalid_input("blackbody_spectrum: wavelength must be positive");

            double wlm = wavelength_nm * 1e-9;   /* Wavelength in meters */

            /* expm1 keeps the denominator nonzero when c2 / (wl * T) is tiny. */
            double Me = (first_radiation_constant * std::pow(wlm, -5.0)) /
                        std::expm1(second_radiation_constant / (wlm * m_temperature));

            if (!std::isfinite(Me))
                throw invalid_input("blackbody_spectrum: emittance overflows at this temperature and wavelength");

            return Me;
        }

        double operator()(const units::length& wavelength) const
        {
            return (*this)(units::to_nanometers(wavelength));
        }

    private:

        double m_temperature;

    };

    inline blackbody_spectrum bb_spectrum(double kelvin)
    {
        return blackbody_spectrum(kelvin);
    }

    inline blackbody_spectrum bb_spectrum(const units::temperature& t)
    {
        return blackbody_spectrum(t);
    }

}//! namespace chroma;

#endif//CHROMA_BLACKBODY_HPP
