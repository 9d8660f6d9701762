//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_COLOR_EXCEPTIONS_HPP
#define CHROMA_COLOR_EXCEPTIONS_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace chroma {

    //! Thrown when a computation would divide by zero or leave the domain of a real function.
    struct domain_error : std::domain_error
    {
        explicit domain_error(const std::string& what)
            : std::domain_error(what)
        {}
    };

    //! Thrown when a spectrum integrates to zero over the sampled band.
    struct divide_by_zero : domain_error
    {
        explicit divide_by_zero(const std::string& what)
            : domain_error(what)
        {}
    };

    //! Thrown for non-physical parameters (e.g. a non-positive absolute temperature).
    struct invalid_input : std::invalid_argument
    {
        explicit invalid_input(const std::string& what)
            : std::invalid_argument(what)
        {}
    };

    namespace detail {
        //! Return the denominator or throw when it is exactly zero.
        inline double checked_denominator(double d, const char* what)
        {
            if (d == 0.0)
                throw domain_error(what);
            return d;
        }

        //! Return the pivot or throw when it is indistinguishable from zero at the given magnitude.
        //! scale is the product of the norms of the factors that produced the pivot.
        inline double checked_pivot(double pivot, double scale, const char* what)
        {
            if (!std::isfinite(pivot) || std::abs(pivot) <= 64.0 * std::numeric_limits<double>::epsilon() * scale)
                throw domain_error(what);
            return pivot;
        }
    }//! namespace detail;

}//! namespace chroma;

#endif//CHROMA_COLOR_EXCEPTIONS_HPP
