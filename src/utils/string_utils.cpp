/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * Base64 is used as the transport encoding for untrusted code embedded in
 * wrapper scripts; the byte-size parser understands the unit suffixes that
 * `docker stats` prints ("B", "kB", "MiB", "GiB", ...).
 *
 * @date 2025
 */

#include "codebox/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace codebox {
namespace utils {

namespace {

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::size_t StringUtils::Utf8Length(const std::string& str) {
    std::size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return Contains(ToLower(str), ToLower(substring));
}

// ============================================================================
// BASE64
// ============================================================================

std::string StringUtils::ToBase64(const std::string& str) {
    std::string result;
    result.reserve(((str.size() + 2) / 3) * 4);

    std::uint32_t val = 0;
    int valb = -6;

    for (unsigned char c : str) {
        val = ((val << 8) | c) & 0xFFFFFFu;
        valb += 8;

        while (valb >= 0) {
            result.push_back(kBase64Chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(kBase64Chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::string StringUtils::FromBase64(const std::string& base64) {
    static const std::array<int, 256> lookup = [] {
        std::array<int, 256> table{};
        table.fill(-1);
        for (int i = 0; i < 64; ++i) {
            table[static_cast<unsigned char>(kBase64Chars[i])] = i;
        }
        return table;
    }();

    std::string result;
    result.reserve((base64.size() / 4) * 3);

    std::uint32_t val = 0;
    int valb = -8;

    for (unsigned char c : base64) {
        if (c == '=') break;
        if (lookup[c] == -1) {
            throw std::invalid_argument("Invalid Base64 character");
        }
        val = ((val << 6) | static_cast<std::uint32_t>(lookup[c])) & 0xFFFFFFu;
        valb += 6;

        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return result;
}

// ============================================================================
// BYTE SIZES
// ============================================================================

std::optional<std::uint64_t> StringUtils::ParseByteSize(const std::string& text) {
    std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::size_t unit_pos = 0;
    while (unit_pos < trimmed.size() &&
           (std::isdigit(static_cast<unsigned char>(trimmed[unit_pos])) || trimmed[unit_pos] == '.')) {
        ++unit_pos;
    }
    if (unit_pos == 0) {
        return std::nullopt;
    }

    double value = 0.0;
    try {
        value = std::stod(trimmed.substr(0, unit_pos));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string unit = ToLower(Trim(trimmed.substr(unit_pos)));
    double multiplier = 0.0;

    if (unit.empty() || unit == "b") multiplier = 1.0;
    else if (unit == "kb" || unit == "k") multiplier = 1e3;
    else if (unit == "mb" || unit == "m") multiplier = 1e6;
    else if (unit == "gb" || unit == "g") multiplier = 1e9;
    else if (unit == "tb") multiplier = 1e12;
    else if (unit == "kib") multiplier = 1024.0;
    else if (unit == "mib") multiplier = 1024.0 * 1024.0;
    else if (unit == "gib") multiplier = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "tib") multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else return std::nullopt;

    return static_cast<std::uint64_t>(std::llround(value * multiplier));
}

std::string StringUtils::FormatSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace codebox
