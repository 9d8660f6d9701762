//
//! Copyright © 2017
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_BOOST_UNITS_HPP
#define CHROMA_BOOST_UNITS_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <boost/units/quantity.hpp>
#include <boost/units/systems/si.hpp>
#include <boost/units/systems/si/prefixes.hpp>
#include <boost/units/make_scaled_unit.hpp>
#include <boost/units/io.hpp>

namespace chroma { 

namespace units {
    using namespace boost::units;

    using length = quantity<si::length, double>;
    using temperature = quantity<si::temperature, double>;//! absolute (thermodynamic) temperature.

    //! Wavelengths of visible light are tabulated in nanometers.
    using nanometer_unit = make_scaled_unit<si::length, scale<10, static_rational<-9>>>::type;
    using wavelength = quantity<nanometer_unit, double>;

    BOOST_UNITS_STATIC_CONSTANT(nanometer, nanometer_unit);
    BOOST_UNITS_STATIC_CONSTANT(nanometers, nanometer_unit);

    using boost::units::si::kelvin;
    using boost::units::si::meters;

    //! Express a length in nanometers as a raw double.
    inline double to_nanometers(const length& l)
    {
        return wavelength(l).value();
    }

    inline double to_kelvin(const temperature& t)
    {
        return t.value();
    }
}//! namespace units;

}//! namespace chroma;

#endif//CHROMA_BOOST_UNITS_HPP
