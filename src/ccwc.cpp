// Accepts a filename as its last argument or reads from standard in, then
// prints the line, word, byte or character counts asked for by the flags.

#include <ccwc/analyzer.h>
#include <ccwc/cmds.h>
#include <ccwc/error.h>
#include <iostream>
#include <ostream>
#include <string>

using std::cerr;
using std::cout;
using std::endl;
using std::ostream;
using std::string;

int main(int argc, const char * * args) {
    const string program = (argc > 0) ? args[0] : "ccwc";

    const auto parsed = ccwc::parse_command_line(argc, args);
    if (ccwc::is_error(parsed)) {
        cerr << "Error: " << ccwc::get_error(parsed).message << endl;
        ccwc::print_usage(cerr, program);
        return ccwc::exit_failure;
    }
    const ccwc::command_line & cmd = ccwc::get_value(parsed);

    if (cmd.help) {
        ccwc::print_usage(cout, program);
        return ccwc::exit_success;
    }

    // Without --verbose, logging goes to a stream with no buffer.
    ostream quiet(nullptr);
    ostream & log = cmd.verbose ? cerr : quiet;

    ccwc::stop_watch watch;
    const auto output = ccwc::analyze(cmd.opts, log);
    if (ccwc::is_error(output)) {
        const ccwc::error & e = ccwc::get_error(output);
        log << "Failed with " << ccwc::kind_name(e.kind) << "." << endl;
        cerr << "Error: " << e.message << endl;
        return ccwc::exit_failure;
    }

    cout << ccwc::get_value(output) << endl;
    watch.print_time(log);
    return ccwc::exit_success;
}
