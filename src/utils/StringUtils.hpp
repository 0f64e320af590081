// modeld - String Utilities
// String helpers for locators, paths and log output

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modeld::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static std::string toUpper(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Replaces every character outside [A-Za-z0-9] with '_'
    static std::string sanitizeName(const std::string& name);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatPercentage(double value, int precision = 2);

    // Parsing
    static int64_t parseLong(const std::string& str, int64_t defaultValue = 0);
};

} // namespace modeld::utils
