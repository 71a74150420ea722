// Environment policy for sensitive values (key paths, user names) in logs
// and error details.
#pragma once

#include <cstdlib>
#include <string>

namespace sitebackup {

// Value of `name`, trimmed and lower-cased; empty when unset.
inline std::string envSetting(const char *name) {
    const char *raw = std::getenv(name);
    const std::string value = raw ? raw : "";
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    std::string out = value.substr(first, value.find_last_not_of(" \t\r\n") - first + 1);
    for (char &c : out) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

// On only for SITE_BACKUP_ENV=dev together with SITE_BACKUP_LOG_SENSITIVE=1.
inline bool sensitiveLoggingEnabled() {
    const std::string env = envSetting("SITE_BACKUP_ENV");
    if (env != "dev" && env != "development")
        return false;
    const std::string flag = envSetting("SITE_BACKUP_LOG_SENSITIVE");
    return flag == "1" || flag == "true";
}

// `value` when sensitive logging is enabled, a fixed placeholder otherwise.
inline std::string redactSensitive(const std::string &value) {
    return sensitiveLoggingEnabled() ? value : std::string("<redacted>");
}

} // namespace sitebackup
