//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_COLOR_SPECTRUM_HPP
#define CHROMA_COLOR_SPECTRUM_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <chroma/color/blackbody.hpp>
#include <chroma/color/color_system.hpp>
#include <chroma/color/exceptions.hpp>
#include <chroma/color/gamma_correct.hpp>
#include <chroma/color/gamut.hpp>
#include <chroma/color/spectrum_to_xyz.hpp>
#include <chroma/color/tristimulus.hpp>
#include <chroma/color/xyz_to_rgb.hpp>
#include <chroma/units/boost_units.hpp>
#include <chroma/utility/color.hpp>

#include <algorithm>

namespace chroma {

    struct spectrum_color_options
    {
        double brightness = 1.0;//! scale applied to the chromaticity before conversion.
        bool   normalize = true;
        bool   gamma = false;
    };

    struct spectrum_color
    {
        chromaticity xyz;
        rgb          unconstrained;
        rgb          color;
        bool         approximated = false;//! true when the color was outside the gamut and had to be desaturated.
    };

    namespace detail {

        inline spectrum_color render_chromaticity(const chromaticity& c, const rgb_transform& transform, const color_system& cs, const spectrum_color_options& options)
        {
            spectrum_color result;
            result.xyz = c;
            result.unconstrained = transform(to_tristimulus(c, options.brightness));
            result.color = result.unconstrained;
            result.approximated = constrain_rgb(result.color);
            if (options.normalize)
                result.color = norm_rgb(result.color);
            if (options.gamma)
                result.color = gamma_correct_rgb(cs, result.color);
            return result;
        }

    }//! namespace detail;

    //! Run a spectral source through the whole pipeline: integrate, convert to the primaries of cs, desaturate, normalize and correct.
    template <typename SpectralIntensity>
    inline spectrum_color spectrum_to_rgb(const SpectralIntensity& source, const color_system& cs, const spectrum_color_options& options = spectrum_color_options{})
    {
        return detail::render_chromaticity(spectrum_to_xyz(source), rgb_transform{ cs }, cs, options);
    }

    inline spectrum_color blackbody_to_rgb(double kelvin, const color_system& cs, const spectrum_color_options& options = spectrum_color_options{})
    {
        return spectrum_to_rgb(blackbody_spectrum(kelvin), cs, options);
    }

    inline spectrum_color blackbody_to_rgb(const units::temperature& t, const color_system& cs, const spectrum_color_options& options = spectrum_color_options{})
    {
        return spectrum_to_rgb(blackbody_spectrum(t), cs, options);
    }

    struct temperature_mapper_options
    {
        double cold_temperature = 1000.0;//! kelvin at the low end of the range.
        double hot_temperature = 9000.0;
        double min_brightness = 0.75;
        double max_brightness = 1.0;
        const color_system* system = &color_systems::smpte();
    };

    //! Maps a scalar reading in [xmin, xmax] onto the color of a black body heated from cold to hot.
    //! Readings outside the range are clamped to its ends.
    class temperature_color_mapper
    {
    public:

        temperature_color_mapper(double xmin, double xmax, const temperature_mapper_options& options = temperature_mapper_options{})
            : m_xmin{xmin}
            , m_range{xmax - xmin}
            , m_options(options)
            , m_transform{ *checked_system(options.system) }
        {
            if (m_range == 0.0)
                throw invalid_input("temperature_color_mapper: xmax must differ from xmin");
        }

        //! Normalized position of x within the range.
        double parameter(double x) const
        {
            return (std::min)((std::max)((x - m_xmin) / m_range, 0.0), 1.0);
        }

        double temperature(double x) const
        {
            double t = parameter(x);
            return m_options.cold_temperature + t * (m_options.hot_temperature - m_options.cold_temperature);
        }

        double brightness(double x) const
        {
            double t = parameter(x);
            return m_options.min_brightness + t * (m_options.max_brightness - m_options.min_brightness);
        }

        rgb to_rgb(double x) const
        {
            auto c = detail::render_chromaticity(spectrum_to_xyz(blackbody_spectrum(temperature(x))), m_transform, *m_options.system, spectrum_color_options{});
            return c.color * brightness(x);
        }

        color_rgba operator()(double x) const
        {
            return to_color_rgba(to_rgb(x));
        }

    private:

        static const color_system* checked_system(const color_system* cs)
        {
            if (cs == nullptr)
                throw invalid_input("temperature_color_mapper: no color system given");
            return cs;
        }

        double                     m_xmin;
        double                     m_range;
        temperature_mapper_options m_options;
        rgb_transform              m_transform;

    };

}//! namespace chroma;

#endif//CHROMA_COLOR_SPECTRUM_HPP
