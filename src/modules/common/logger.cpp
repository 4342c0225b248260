#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include <algorithm>
#include <cctype>

namespace dcp {
LogLevel parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warning" || s == "warn") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    throw ConfigError("Unknown log level '" + name + "'");
}
}
