//
//! Copyright © 2018
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#define BOOST_ERROR_CODE_HEADER_ONLY
#include <boost/system/error_code.hpp>
#include <boost/dll.hpp>
#include <boost/chrono.hpp>
#include <boost/thread.hpp>
#include <boost/lexical_cast.hpp>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <regex>
#include <string>

namespace {

    const char* const usage = "Usage: gtest_runner <path-to-module> [-t=<timeout in milliseconds>] [-fname=MyTestHookFunction] [google test options]";

    struct runner_options
    {
        std::string module_path;
        std::string hook = "RUN_GOOGLE_TESTS";
        int         timeout_ms = 60000;
    };

    //! Options the runner does not recognize are left for google test.
    bool parse_options(int argc, char* argv[], runner_options& opts)
    {
        static const std::regex timeoutRegex("\\s*-t=(\\d+)");
        static const std::regex fnameRegex("\\s*-fname=(\\w+)");

        opts.module_path = argv[1];
        for (auto i = 2; i < argc; ++i)
        {
            std::cmatch match;
            if (std::regex_match(argv[i], match, timeoutRegex))
            {
                try
                {
                    opts.timeout_ms = boost::lexical_cast<int>(match.str(1));
                }
                catch (const boost::bad_lexical_cast&)
                {
                    std::cerr << "Bad format specified for timeout option.\n" << usage << std::endl;
                    return false;
                }
                continue;
            }

            if (std::regex_match(argv[i], match, fnameRegex))
                opts.hook = match.str(1);
        }

        return true;
    }

}//! namespace;

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << usage << std::endl;
        return 0;
    }

    runner_options opts;
    if (!parse_options(argc, argv, opts))
        return 1;

    try
    {
        auto tests = boost::dll::import<int(int*, char**)>(opts.module_path, opts.hook.c_str(), boost::dll::load_mode::append_decorations);

        std::cout << "Running Tests in " << opts.module_path << std::endl;
        std::atomic<int> result{ 1 };
        auto deadline = boost::chrono::system_clock::now() + boost::chrono::milliseconds(opts.timeout_ms);
        boost::thread testThread([&]() { result = tests(&argc, argv); });
        if (!testThread.try_join_until(deadline))
        {
            std::cerr << "Error: tests exceeded the timeout of " << opts.timeout_ms << " ms. This may indicate a test with an infinite loop.\nTry running again with a longer timeout using the -t option." << std::endl;
            std::quick_exit(1);
        }

        return result;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: Cannot load module at: " << opts.module_path << " (" << e.what() << ")" << std::endl;
    }

    return 1;
}
