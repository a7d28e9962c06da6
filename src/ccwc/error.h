// Failure values passed back from the reading and parsing routines.

#ifndef FILE_GUARD_CCWC_ERROR_H
#define FILE_GUARD_CCWC_ERROR_H

#include <stdexcept>
#include <string>
#include <boost/variant.hpp>

namespace ccwc {

enum class error_kind {
    invalid_argument,
    io_error
};

struct error {
    error_kind kind;
    std::string message;

    error(error_kind kind, const std::string & message)
    :   kind(kind),
        message(message)
    {}
};

// Either a value or the error that stopped us from producing it.
template<typename T>
using result = boost::variant<T, error>;

template<typename T>
bool is_error(const result<T> & r) {
    return nullptr != boost::get<error>(&r);
}

template<typename T>
const error & get_error(const result<T> & r) {
    return boost::get<error>(r);
}

// Throws boost::bad_get if R holds an error.
template<typename T>
const T & get_value(const result<T> & r) {
    return boost::get<T>(r);
}

inline const char * kind_name(const error_kind kind) {
    switch (kind) {
        case error_kind::invalid_argument:
            return "invalid argument";
        case error_kind::io_error:
            return "I/O error";
    }
    throw std::logic_error("Unknown error_kind.");
}

}  // end namespace ccwc

#endif
