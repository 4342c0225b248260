#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace dcp {
struct OutOfBounds : std::out_of_range {
    using std::out_of_range::out_of_range;
};

struct ConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct IoError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised by a stage that stops early because another stage failed.
struct PipelineAborted : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised by texture computation when a co-occurrence matrix has no entries.
struct EmptyCooccurrence : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Flattens a (possibly nested) exception into "outer: inner: ..." for logging.
inline std::string describe(const std::exception& e) {
    std::string out = e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        out += ": " + describe(inner);
    } catch (...) {
        out += ": <non-standard exception>";
    }
    return out;
}
}
