//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef CHROMA_BLACKBODY_TABLE_OPTIONS_HPP
#define CHROMA_BLACKBODY_TABLE_OPTIONS_HPP

#if defined(_MSC_VER)
    #pragma once
#endif

#include <boost/lexical_cast.hpp>
#include <ostream>
#include <regex>
#include <string>

namespace chroma { namespace tools {

    const char* const blackbody_table_usage = "Usage: blackbody_table [-system=<name>] [-tmin=<kelvin>] [-tmax=<kelvin>] [-step=<kelvin>] [-ansi]";

    struct table_options
    {
        std::string system = "SMPTE";
        double      tmin = 1000.0;
        double      tmax = 10000.0;
        double      step = 500.0;
        bool        ansi = false;
    };

    //! Parse -key=value arguments into opts. Writes the reason and usage to err and returns false on bad input.
    inline bool parse_options(int argc, const char* const argv[], table_options& opts, std::ostream& err)
    {
        static const std::regex systemRegex("\\s*-system=(.+)");
        static const std::regex numberRegex("\\s*-(tmin|tmax|step)=(\\S+)");
        static const std::regex ansiRegex("\\s*-ansi");

        for (auto i = 1; i < argc; ++i)
        {
            std::cmatch match;
            if (std::regex_match(argv[i], match, systemRegex))
            {
                opts.system = match.str(1);
                continue;
            }

            if (std::regex_match(argv[i], match, numberRegex))
            {
                try
                {
                    auto v = boost::lexical_cast<double>(match.str(2));
                    if (match.str(1) == "tmin")
                        opts.tmin = v;
                    else if (match.str(1) == "tmax")
                        opts.tmax = v;
                    else
                        opts.step = v;
                }
                catch (const boost::bad_lexical_cast&)
                {
                    err << "Bad format specified for " << match.str(1) << " option.\n" << blackbody_table_usage << std::endl;
                    return false;
                }
                continue;
            }

            if (std::regex_match(argv[i], ansiRegex))
            {
                opts.ansi = true;
                continue;
            }

            err << "Unknown option: " << argv[i] << "\n" << blackbody_table_usage << std::endl;
            return false;
        }

        if (!(opts.tmin > 0) || opts.tmax < opts.tmin || !(opts.step > 0))
        {
            err << "Temperatures must be positive with tmin <= tmax and step > 0.\n" << blackbody_table_usage << std::endl;
            return false;
        }

        return true;
    }

}}//! namespace chroma::tools;

#endif//CHROMA_BLACKBODY_TABLE_OPTIONS_HPP
