/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sandbox engine
 *
 * Trimming, splitting and case conversion used when parsing container
 * runtime output, Base64 transport encoding for untrusted code, and
 * byte-size parsing/formatting for memory limits and usage metrics.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace codebox {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Encode untrusted code so it can be embedded in a wrapper script
 * std::string encoded = StringUtils::ToBase64(user_code);
 *
 * // Parse "12.5MiB" from `docker stats` output
 * auto bytes = StringUtils::ParseByteSize("12.5MiB");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens are skipped.
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of substrings
     *
     * **Example**:
     * @code
     * auto lines = StringUtils::Split("abc\n\ndef\n", '\n');
     * // lines = ["abc", "def"]
     * @endcode
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     *
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Count UTF-8 code points
     *
     * Counts every byte that is not a continuation byte, so malformed input
     * still yields a bounded count.
     */
    static std::size_t Utf8Length(const std::string& str);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive substring search
     * @param str String to search in
     * @param substring Substring to find
     * @return true if substring found ignoring ASCII case
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Encode string to Base64 (RFC 4648, padded)
     *
     * The output alphabet is `[A-Za-z0-9+/=]`: it contains no quotes,
     * backslashes or newlines, so it can be embedded in any string literal
     * of a generated script without escaping.
     *
     * @param str Input bytes
     * @return Base64-encoded string
     */
    static std::string ToBase64(const std::string& str);

    /**
     * @brief Decode Base64 string
     *
     * Decoding stops at the first padding character.
     *
     * @param base64 Base64-encoded string
     * @return Decoded bytes
     *
     * @throws std::invalid_argument if a character outside the alphabet is found
     */
    static std::string FromBase64(const std::string& base64);

    /***************************************************************************
     * Byte Sizes
     ***************************************************************************/

    /**
     * @brief Parse a human-readable size as printed by the Docker CLI
     *
     * Accepts decimal (`kB`, `MB`, `GB`) and binary (`KiB`, `MiB`, `GiB`)
     * units as well as plain bytes (`B`). Fractions are allowed.
     *
     * @param text Size string, e.g. "12.5MiB" or "0B"
     * @return Size in bytes, or std::nullopt if the text is not a size
     */
    static std::optional<std::uint64_t> ParseByteSize(const std::string& text);

    /**
     * @brief Format byte count for display ("1.50 MB")
     * @param bytes Byte count
     * @return Formatted size using 1024-based units
     */
    static std::string FormatSize(std::uint64_t bytes);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum allowed length
     * @param suffix Suffix to append if truncated (default: "...")
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace codebox
