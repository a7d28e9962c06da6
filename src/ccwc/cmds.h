// Contains some helper utilities for the ccwc command.

#ifndef FILE_GUARD_CCWC_CMDS_H
#define FILE_GUARD_CCWC_CMDS_H

#include <chrono>
#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <ccwc/error.h>
#include <ccwc/options.h>

namespace ccwc {

constexpr int exit_success = 0;
constexpr int exit_failure = 1;

// This class prints out the elapsed time.
class stop_watch {
public:
    stop_watch()
    :   start_time(hrclock::now()) {
    }

    template<typename LogStream>
    void print_time(LogStream & log) const {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;

        auto end_time = hrclock::now();
        log << "Elapsed time: "
            << duration_cast<milliseconds>(end_time - start_time).count()
            << "ms" << std::endl;
    }

private:
    using hrclock = std::chrono::high_resolution_clock;
    decltype(hrclock::now()) start_time;
};

// Everything the command line can ask for.
struct command_line {
    options opts;
    bool verbose;
    bool help;

    command_line(const options & opts, bool verbose, bool help)
    :   opts(opts),
        verbose(verbose),
        help(help)
    {}
};

inline void print_usage(std::ostream & out, const std::string & program) {
    out << "Usage: " << program << " [-c] [-l] [-w] [-m] [--verbose] [file]\n"
        << "\n"
        << "Counts newlines, words and bytes in FILE, or in standard input\n"
        << "when no file is given.\n"
        << "\n"
        << "  -c         print the byte count\n"
        << "  -l         print the newline count\n"
        << "  -w         print the word count\n"
        << "  -m         print the character count (ignored with -c)\n"
        << "  --verbose  log progress to standard error\n"
        << "  -h, --help show this message\n";
}

// Parses the arguments after the program name. Flags may repeat and may
// come before or after the file name. Anything else starting with '-',
// including a lone "-", is an unknown option.
inline result<command_line> parse_arguments(
    const std::vector<std::string> & args)
{
    count_flags flags;
    bool verbose = false;
    bool help = false;
    boost::optional<std::string> file_name;

    for (const std::string & arg : args) {
        if (arg == "-c") {
            flags.bytes = true;
        } else if (arg == "-l") {
            flags.lines = true;
        } else if (arg == "-w") {
            flags.words = true;
        } else if (arg == "-m") {
            flags.chars = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return error(error_kind::invalid_argument,
                         "Unknown option: " + arg);
        } else if (arg.empty()) {
            return error(error_kind::invalid_argument,
                         "Empty file name.");
        } else if (file_name) {
            return error(error_kind::invalid_argument,
                         "Multiple filenames not supported: "
                         + file_name.get() + ", " + arg);
        } else {
            file_name = arg;
        }
    }

    if (file_name) {
        return command_line(make_options(flags, file_name.get()),
                            verbose, help);
    }
    return command_line(make_options(flags), verbose, help);
}

inline result<command_line> parse_command_line(int argc,
                                               const char * const * args) {
    std::vector<std::string> list;
    for (int i = 1; i < argc; ++ i) {
        list.push_back(args[i]);
    }
    return parse_arguments(list);
}

}  // end namespace ccwc

#endif
