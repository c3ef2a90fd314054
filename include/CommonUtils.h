#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Comma-separated list; blank items are kept only when keepEmpty is set.
inline std::vector<std::string> splitList(const std::string& s, bool keepEmpty = false) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            std::string t = trim(cur);
            if (keepEmpty || !t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (keepEmpty || !t.empty()) out.push_back(t);
    return out;
}

inline std::string formatDouble(double value, int precision = 4) {
    if (!std::isfinite(value)) return "n/a";
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

inline std::string formatOptional(const std::optional<double>& value, int precision = 4) {
    return value ? formatDouble(*value, precision) : "n/a";
}

} // namespace CommonUtils
