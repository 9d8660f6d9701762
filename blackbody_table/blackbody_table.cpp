//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <chroma/color/color_spectrum.hpp>
#include <chroma/color/color_system.hpp>
#include <chroma/utility/color.hpp>
#include "table_options.hpp"

#include <cmath>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>

namespace {

    void print_row(std::ostream& os, double kelvin, const chroma::spectrum_color& c, bool ansi)
    {
        if (ansi)
        {
            auto q = chroma::to_color_rgba(c.color);
            os << "\x1b[48;2;" << static_cast<int>(q.red) << ";" << static_cast<int>(q.green) << ";" << static_cast<int>(q.blue) << "m";
        }

        os << std::setw(7) << std::setprecision(0) << kelvin << " K      "
           << std::setprecision(4) << c.xyz.x << " " << c.xyz.y << " " << c.xyz.z << "   "
           << std::setprecision(3) << c.color.r << " " << c.color.g << " " << c.color.b;

        if (c.approximated)
            os << " (Approximation)";

        if (ansi)
            os << "\x1b[0m";

        os << "\n";
    }

}//! namespace;

int main(int argc, char* argv[])
{
    chroma::tools::table_options opts;
    if (!chroma::tools::parse_options(argc, argv, opts, std::cerr))
        return 1;

    try
    {
        const auto& cs = chroma::get_color_system(opts.system);

        std::cout << "Color system: " << cs.name() << "\n\n";
        std::cout << "Temperature       x      y      z       R     G     B\n";
        std::cout << "-----------    ------ ------ ------   ----- ----- -----\n";
        std::cout << std::fixed;

        auto steps = static_cast<std::size_t>(std::floor((opts.tmax - opts.tmin) / opts.step + 1e-9));
        for (std::size_t i = 0; i <= steps; ++i)
        {
            double t = opts.tmin + static_cast<double>(i) * opts.step;
            print_row(std::cout, t, chroma::blackbody_to_rgb(t, cs), opts.ansi);
        }

        std::cout << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
