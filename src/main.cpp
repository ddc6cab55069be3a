#include <cstddef>
#include <cstdlib>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/optional.hpp>

#include "aux/chunk.hpp"
#include "aux/errors.hpp"
#include "parsers/path_list_parser.hpp"
#include "parsers/pattern_parser.hpp"
#include "reporters/console_reporter.hpp"
#include "scanners/batch_scanner.hpp"
#include "scanners/file_scanner.hpp"
#include "searchers/boyer_moore_searcher.hpp"
#include "searchers/knuth_morris_pratt_searcher.hpp"
#include "searchers/naive_searcher.hpp"

#include "application.hpp"
#include "options.hpp"

using namespace binfind;

namespace
{

template <typename PatternSearcher>
int run(Options const &options, pattern_t const &pattern, PatternSearcher searcher)
{
    FileScanner<PatternSearcher> const scanner(std::move(searcher), pattern.size(), options.settings);

    auto scan_one = [&scanner](std::string const &path, auto sink) {
        return scanner.scan_file(path, std::move(sink));
    };

    ConsoleReporter reporter;
    auto const      failed = scan_batch(options.paths, scan_one, reporter);
    if (0 != failed)
    {
        std::cerr << "error: " << failed << " of " << options.paths.size() << " files could not be scanned\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int run(Options const &options, pattern_t const &pattern)
{
    // below we define a searcher type based on the algorithm chosen
    switch (options.algorithm)
    {
    case Algorithm::boyer_moore:
        return run(options, pattern, BoyerMooreSearcher<pattern_t>(pattern));
    case Algorithm::boost_boyer_moore:
        return run(options, pattern, BoyerMooreSearcher<pattern_t, searchers::Boosted>(pattern));
    case Algorithm::knuth_morris_pratt:
        return run(options, pattern, KnuthMorrisPrattSearcher<pattern_t>(pattern));
    case Algorithm::naive:
        break;
    }
    return run(options, pattern, NaiveSearcher<pattern_t>(pattern));
}

///
/// @brief      Asks for a pattern until a valid one is given
///
/// @return     The pattern, none if the input is over
///
boost::optional<pattern_t> ask_pattern()
{
    auto const &app = Application::instance();
    while (auto line = app.ask(app.pattern_prompt()))
    {
        try
        {
            return parse_pattern(*line);
        }
        catch (InvalidPatternError const &ex)
        {
            std::cout << "Invalid pattern format: " << ex.what() << ". Please try again.\n";
        }
    }
    return boost::none;
}

int run_interactive(Options options)
{
    auto const &app = Application::instance();

    auto const files_line = app.ask(app.files_prompt());
    if (files_line)
        options.paths = parse_path_list(*files_line);

    if (options.paths.empty())
    {
        std::cerr << "error: no files provided, please drag and drop at least one file\n";
        return EXIT_FAILURE;
    }

    auto const pattern = ask_pattern();
    if (!pattern)
    {
        std::cerr << "\nerror: no pattern provided\n";
        return EXIT_FAILURE;
    }

    auto const res = run(options, *pattern);

    // keep the console open until the user has read the results
    if (!app.ask(app.exit_prompt()))
        std::cout << '\n';

    return res;
}

} // anonymous namespace

///
/// @brief      main function, entry point to the program
///
/// @param[in]  argc  The count of arguments
/// @param      argv  The arguments array
///
///             argv[0]    - name of the program
///             options    - see the help page
///             argv[i]    - a pattern to search for
///             argv[i+1.] - input file paths
///
///             The pattern and the paths are asked for if not given
///
/// @return     result of the program, 0 when success, another value otherwise
///
int main(int argc, char const *argv[]) try
{
    // synchronization with printf-like function is disabled
    // since no printf-like functions are used in the application
    std::cout.sync_with_stdio(false);
    std::cerr.sync_with_stdio(false);

    Options options;
    try
    {
        options = parse_options(argc, argv);
    }
    catch (std::invalid_argument const &ex)
    {
        std::cerr << "error: " << ex.what() << '\n';
        Application::instance().help();
        return EXIT_FAILURE;
    }

    if (options.help)
    {
        Application::instance().help();
        return EXIT_SUCCESS;
    }

    if (options.interactive())
        return run_interactive(std::move(options));

    pattern_t pattern;
    try
    {
        pattern = parse_pattern(*options.pattern);
    }
    catch (InvalidPatternError const &ex)
    {
        std::cerr << "error: pattern '" << ex.input() << "' has incorrect format: " << ex.what() << '\n';
        Application::instance().help();
        return EXIT_FAILURE;
    }

    return run(options, pattern);
}
catch (std::exception const &ex)
{
    std::cerr << "error: " << ex.what() << '\n';
    return EXIT_FAILURE;
}
catch (...)
{
    std::cerr << "internal error\n";
    return EXIT_FAILURE;
}
