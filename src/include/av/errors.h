#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace av {

struct Error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed schema or instance text. Raised before any validation starts.
// `line` and `column` are 1-based; zero when the location is unknown
// (e.g. a structural problem found after reading).
struct ParseError : public Error {
    std::size_t line = 0;
    std::size_t column = 0;

    explicit ParseError(const std::string& msg) : Error(msg) {}
    ParseError(const std::string& msg, std::size_t l, std::size_t c) : Error(msg), line(l), column(c) {}
};

// The validation step budget ran out. Aborts the whole validate() call.
struct LimitExceeded : public Error {
    std::size_t steps = 0;

    LimitExceeded(const std::string& msg, std::size_t s) : Error(msg), steps(s) {}
};

}  // namespace av
