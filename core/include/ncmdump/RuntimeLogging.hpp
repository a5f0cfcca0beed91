// Diagnostics switches read from the environment, and path redaction for logs.
#pragma once

#include <string>

namespace ncmdump {

struct LogPolicy {
    // NCMDUMP_ENV=dev|development|local|debug
    bool debugCategories = false;
    // NCMDUMP_LOG_PATHS=1|true|yes|on, honoured only together with
    // debugCategories
    bool fullPaths = false;
};

// Builds a policy from raw variable values; either may be null.
LogPolicy parseLogPolicy(const char *envValue, const char *logPathsValue);

// Policy of this process, read from the environment on first use.
const LogPolicy &logPolicy();

// Returns path unchanged when full paths may be logged, otherwise only its
// file name.
std::string loggablePath(const std::string &path, const LogPolicy &policy);

inline std::string loggablePath(const std::string &path) {
    return loggablePath(path, logPolicy());
}

} // namespace ncmdump
