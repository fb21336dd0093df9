#include "logger.hpp"
#include "sampen_core.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fastsampen {

LogLevel parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "error") return LogLevel::Error;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "info") return LogLevel::Info;
    if (s == "debug") return LogLevel::Debug;
    throw InvalidParameter("unknown log level '" + name + "'");
}

static LogLevel initial_level() {
    const char* env = std::getenv("FASTSAMPEN_LOG_LEVEL");
    if (env == nullptr || *env == '\0') return LogLevel::Warn;
    try {
        return parse_log_level(env);
    } catch (const InvalidParameter& e) {
        std::cerr << "[fastsampen WARN] FASTSAMPEN_LOG_LEVEL: " << e.what() << ", using warn" << std::endl;
        return LogLevel::Warn;
    }
}

Logger& logger() {
    static Logger instance(initial_level());
    return instance;
}

} // namespace fastsampen
