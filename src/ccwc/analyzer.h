// Turns a source into the line ccwc prints for it.

#ifndef FILE_GUARD_CCWC_ANALYZER_H
#define FILE_GUARD_CCWC_ANALYZER_H

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <ccwc/count.h>
#include <ccwc/error.h>
#include <ccwc/filesystem.h>
#include <ccwc/options.h>

namespace ccwc {

constexpr int field_width = 8;

inline void append_field(std::ostream & out, const std::uint64_t count) {
    out << std::setw(field_width) << count;
}

// Builds the output line. Fields come out in the order lines, words, then
// bytes or chars. Bytes win if both were asked for. With no flags at all
// the line is lines, words, bytes.
inline std::string format(const statistics & stats, const options & opts) {
    std::ostringstream out;

    if (opts.count_lines()) {
        append_field(out, stats.lines);
    }
    if (opts.count_words()) {
        append_field(out, stats.words);
    }
    if (opts.count_bytes()) {
        append_field(out, stats.bytes);
    } else if (opts.count_chars()) {
        append_field(out, stats.chars);
    }

    if (opts.is_default_mode()) {
        append_field(out, stats.lines);
        append_field(out, stats.words);
        append_field(out, stats.bytes);
    }

    if (!opts.reads_stdin()) {
        out << " " << opts.file_name();
    }
    return out.str();
}

// False when the only field that will be printed is the byte count of a
// file, which its metadata already knows.
inline bool needs_content(const options & opts) {
    const bool only_bytes = opts.count_bytes()
        && !opts.count_lines() && !opts.count_words();
    return !(only_bytes && !opts.reads_stdin());
}

// Reads the source named in OPTS and computes its statistics. Progress
// goes to LOG.
template<typename LogStream>
result<statistics> collect_statistics(const options & opts, LogStream & log) {
    const std::string name = describe(opts.get_source());

    if (!needs_content(opts)) {
        log << "Taking the size of \"" << name << "\" from its metadata."
            << std::endl;
        const result<std::uint64_t> size = file_size(opts.file_name());
        if (is_error(size)) {
            return get_error(size);
        }
        statistics stats;
        stats.bytes = get_value(size);
        return stats;
    }

    log << "Reading " << (opts.reads_stdin() ? "" : "file ")
        << "\"" << name << "\"..." << std::endl;
    const result<std::string> content = read_all(opts.get_source());
    if (is_error(content)) {
        return get_error(content);
    }
    log << "Read " << get_value(content).size() << " bytes." << std::endl;
    return compute_statistics(get_value(content));
}

// Does the whole job for one source: read, count and format.
template<typename LogStream>
result<std::string> analyze(const options & opts, LogStream & log) {
    const result<statistics> stats = collect_statistics(opts, log);
    if (is_error(stats)) {
        return get_error(stats);
    }
    return format(get_value(stats), opts);
}

}  // end namespace ccwc

#endif
