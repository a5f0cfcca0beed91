#include "ncmdump/RuntimeLogging.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace ncmdump {

static std::string lowerTrimmed(const char *raw) {
    if (!raw)
        return {};
    std::string v(raw);
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

template <std::size_t N>
static bool oneOf(const std::string &v, const std::array<const char *, N> &words) {
    return std::any_of(words.begin(), words.end(),
                       [&v](const char *w) { return v == w; });
}

LogPolicy parseLogPolicy(const char *envValue, const char *logPathsValue) {
    static const std::array<const char *, 4> kDevNames = {"dev", "development", "local", "debug"};
    static const std::array<const char *, 4> kOnValues = {"1", "true", "yes", "on"};

    LogPolicy p;
    p.debugCategories = oneOf(lowerTrimmed(envValue), kDevNames);
    p.fullPaths = p.debugCategories && oneOf(lowerTrimmed(logPathsValue), kOnValues);
    return p;
}

const LogPolicy &logPolicy() {
    static const LogPolicy policy =
        parseLogPolicy(std::getenv("NCMDUMP_ENV"), std::getenv("NCMDUMP_LOG_PATHS"));
    return policy;
}

std::string loggablePath(const std::string &path, const LogPolicy &policy) {
    if (policy.fullPaths)
        return path;
    const auto slash = path.find_last_of("/\\");
    if (slash == std::string::npos)
        return path;
    return path.substr(slash + 1);
}

} // namespace ncmdump
