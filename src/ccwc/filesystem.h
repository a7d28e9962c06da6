// Gets bytes (or just their number) out of a file or standard input.

#ifndef FILE_GUARD_CCWC_FILESYSTEM_H
#define FILE_GUARD_CCWC_FILESYSTEM_H

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant.hpp>
#include <ccwc/error.h>
#include <ccwc/options.h>

namespace ccwc {

constexpr std::size_t buffer_size = 10 * 1024;

template<typename InputStream>
struct stream_ref_wrapper {
    InputStream & stream;

    stream_ref_wrapper(InputStream & stream)
    :   stream(stream)
    {}

    bool has_more() const {
        return stream && stream.good() && !stream.eof();
    }

    template<typename Iterator, typename SizeType>
    SizeType read(Iterator output_buffer, SizeType count) {
        stream.read(output_buffer, count);
        return stream.gcount();
    }
};

// Repeatedly reads from an input stream into a buffer it creates, handing
// each fresh chunk to a processor function as a begin / end pair until the
// stream runs dry.
template<int size, typename Input, typename Func>
auto read_using_buffer(Input & input, Func & process_chunk)
    -> decltype(input.has_more(), void())
{
    char buffer[size];
    while(input.has_more()) {
        const auto length = input.read(
            buffer, static_cast<std::streamsize>(size));
        process_chunk(buffer, buffer + length);
    }
}

// This overload works for typical input streams. It uses the decltype to
// determine if the overload is appropriate by seeing if the argument has
// a "good" method.
template<int size, typename InputStream, typename Func>
auto read_using_buffer(InputStream & input_stream, Func & process_chunk)
    -> decltype(input_stream.good(), void())
{
    stream_ref_wrapper<InputStream> wrapper(input_stream);
    read_using_buffer<size>(wrapper, process_chunk);
}

// Turns on badbit exceptions for a stream and puts back whatever mask it
// had before when destroyed.
template<typename InputStream>
class exception_mask_guard {
public:
    explicit exception_mask_guard(InputStream & stream)
    :   stream(stream),
        old_mask(stream.exceptions())
    {
        stream.exceptions(std::ios_base::badbit);
    }

    // State bits the old mask would throw on are dropped; a destructor
    // mustn't throw.
    ~exception_mask_guard() {
        const std::ios_base::iostate state = stream.rdstate();
        stream.clear();
        stream.exceptions(old_mask);
        stream.clear(state & ~old_mask);
    }

    exception_mask_guard(const exception_mask_guard & rhs) = delete;
    exception_mask_guard & operator=(const exception_mask_guard & rhs) = delete;

private:
    InputStream & stream;
    std::ios_base::iostate old_mask;
};

// Drains a stream into a string. A badbit failure comes back as an io_error
// naming NAME. The stream's exception mask is left as it was found.
template<typename InputStream>
result<std::string> read_stream(InputStream & input, const std::string & name) {
    std::string content;
    auto append = [&content](const char * begin, const char * end) {
        content.append(begin, end);
    };
    if (input.bad()) {
        return error(error_kind::io_error, "Failed to read from " + name);
    }
    try {
        exception_mask_guard<InputStream> guard(input);
        read_using_buffer<buffer_size>(input, append);
    } catch(const std::ios_base::failure &) {
        return error(error_kind::io_error, "Failed to read from " + name);
    }
    return content;
}

// Makes sure PATH names a regular file. Returns an io_error describing why
// not if it doesn't.
inline boost::optional<error> check_regular_file(const std::string & path) {
    boost::system::error_code ec;
    const boost::filesystem::file_status status
        = boost::filesystem::status(path, ec);
    if (ec && status.type() != boost::filesystem::file_not_found) {
        // Something other than absence stopped us, e.g. a parent directory
        // we can't search.
        return error(error_kind::io_error, "Failed to read from " + path);
    }
    if (!boost::filesystem::exists(status)) {
        return error(error_kind::io_error, "File not found: " + path);
    }
    if (!boost::filesystem::is_regular_file(status)) {
        return error(error_kind::io_error, "Not a regular file: " + path);
    }
    return boost::none;
}

inline result<std::string> read_file(const std::string & path) {
    if (auto problem = check_regular_file(path)) {
        return *problem;
    }
    std::ifstream actual_file(path, std::ifstream::binary);
    if (!actual_file) {
        return error(error_kind::io_error, "Failed to read from " + path);
    }
    return read_stream(actual_file, path);
}

// Reads the whole of stdin, blocking until EOF.
inline result<std::string> read_stdin() {
    return read_stream(std::cin, describe(stdin_source()));
}

class source_reader : public boost::static_visitor<result<std::string>> {
public:
    result<std::string> operator()(const stdin_source &) const {
        return read_stdin();
    }

    result<std::string> operator()(const file_source & file) const {
        return read_file(file.path);
    }
};

inline result<std::string> read_all(const source & input) {
    return boost::apply_visitor(source_reader(), input);
}

// Size of a file from its metadata, without reading it. The file must still
// be readable, so this fails exactly when read_file would.
inline result<std::uint64_t> file_size(const std::string & path) {
    if (auto problem = check_regular_file(path)) {
        return *problem;
    }
    {
        std::ifstream actual_file(path, std::ifstream::binary);
        if (!actual_file) {
            return error(error_kind::io_error, "Failed to read from " + path);
        }
    }
    boost::system::error_code ec;
    const auto size = boost::filesystem::file_size(path, ec);
    if (ec) {
        return error(error_kind::io_error, "Failed to read from " + path);
    }
    return static_cast<std::uint64_t>(size);
}

}  // end namespace ccwc

#endif
