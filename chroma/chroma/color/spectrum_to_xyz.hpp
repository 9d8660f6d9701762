//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_SPECTRUM_TO_XYZ_HPP
#define CHROMA_SPECTRUM_TO_XYZ_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/cie_color_match.hpp>
#include <chroma/color/exceptions.hpp>
#include <chroma/color/spectral_source.hpp>
#include <chroma/color/tristimulus.hpp>

#include <cmath>
#include <cstddef>
#include <type_traits>

namespace chroma {

    //! Sum the spectrum against the CIE colour matching functions, keeping luminance.
    template <typename SpectralIntensity>
    inline tristimulus spectrum_to_tristimulus(const SpectralIntensity& spec_intens)
    {
        tristimulus t;
        const auto& table = cie_color_match::table();
        for (std::size_t i = 0; i < cie_color_match::count; ++i)
        {
            double Me = spec_intens(cie_color_match::wavelength(i));
            t.X += Me * table[i][cie_color_match::X];
            t.Y += Me * table[i][cie_color_match::Y];
            t.Z += Me * table[i][cie_color_match::Z];
        }

        return t;
    }

    /*                          SPECTRUM_TO_XYZ

        Calculate the CIE X, Y, and Z coordinates corresponding to
        a light source with spectral distribution given by the
        source, which is called with a series of wavelengths
        between 380 and 780 nm and returns emittance at that
        wavelength in arbitrary units.  The chromaticity
        coordinates of the spectrum are returned and respect the
        identity:

                x + y + z = 1.
    */
    template <typename SpectralIntensity>
    inline chromaticity spectrum_to_xyz(const SpectralIntensity& spec_intens)
    {
        tristimulus t = spectrum_to_tristimulus(spec_intens);
        double XYZ = t.X + t.Y + t.Z;
        if (!std::isfinite(XYZ))
            throw domain_error("spectrum_to_xyz: spectrum integrates to a non-finite sum");
        if (XYZ == 0.0)
            throw divide_by_zero("spectrum_to_xyz: spectrum integrates to zero over 380-780nm");

        return chromaticity{ t.X / XYZ, t.Y / XYZ, t.Z / XYZ };
    }

}//! namespace chroma;

#endif//CHROMA_SPECTRUM_TO_XYZ_HPP
