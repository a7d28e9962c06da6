// The set of counts requested for one run along with where to read from.

#ifndef FILE_GUARD_CCWC_OPTIONS_H
#define FILE_GUARD_CCWC_OPTIONS_H

#include <stdexcept>
#include <string>
#include <boost/variant.hpp>

namespace ccwc {

struct stdin_source {
};

struct file_source {
    std::string path;

    explicit file_source(const std::string & path)
    :   path(path)
    {
        if (path.empty()) {
            throw std::invalid_argument("file_source requires a path.");
        }
    }
};

using source = boost::variant<stdin_source, file_source>;

// Which counts were asked for. Any combination is allowed here; the rules
// about which ones actually get printed are applied when formatting.
struct count_flags {
    bool bytes;
    bool lines;
    bool words;
    bool chars;

    count_flags()
    :   bytes(false),
        lines(false),
        words(false),
        chars(false)
    {}
};

class options {
public:
    options(const count_flags & flags, const source & input)
    :   flags(flags),
        input(input)
    {}

    bool count_bytes() const {
        return flags.bytes;
    }

    bool count_lines() const {
        return flags.lines;
    }

    bool count_words() const {
        return flags.words;
    }

    bool count_chars() const {
        return flags.chars;
    }

    // True when nothing was asked for, in which case lines, words and bytes
    // are shown.
    bool is_default_mode() const {
        return !(flags.bytes || flags.lines || flags.words || flags.chars);
    }

    const source & get_source() const {
        return input;
    }

    bool reads_stdin() const {
        return nullptr != boost::get<stdin_source>(&input);
    }

    // The file name exactly as it was given. Throws boost::bad_get when
    // reading from standard input.
    const std::string & file_name() const {
        return boost::get<file_source>(input).path;
    }

private:
    count_flags flags;
    source input;
};

inline options make_options(const count_flags & flags) {
    return options(flags, stdin_source());
}

inline options make_options(const count_flags & flags,
                            const std::string & file_name) {
    return options(flags, file_source(file_name));
}

// Describes the source for messages.
class source_name : public boost::static_visitor<std::string> {
public:
    std::string operator()(const stdin_source &) const {
        return "standard input";
    }

    std::string operator()(const file_source & file) const {
        return file.path;
    }
};

inline std::string describe(const source & input) {
    return boost::apply_visitor(source_name(), input);
}

}  // end namespace ccwc

#endif
