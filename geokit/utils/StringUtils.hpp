#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GeoKit {

namespace StringUtils {

// Whitespace characters for trimming
inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

/**
 * @brief Split a string by delimiter
 * @param str The string to split
 * @param delimiter The character to split on
 * @param maxParts Stop splitting once this many parts exist (0 = unlimited);
 *                 the last part keeps the remainder of the string
 * @return Vector of string parts
 */
[[nodiscard]] std::vector<std::string> Split(std::string_view str, char delimiter, size_t maxParts = 0);

/**
 * @brief Trim whitespace from both ends of string
 */
[[nodiscard]] std::string Trim(std::string_view str);

/**
 * @brief Convert string to lowercase
 */
[[nodiscard]] std::string ToLower(std::string_view str);

[[nodiscard]] constexpr bool StartsWith(std::string_view str, std::string_view prefix) noexcept {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

/**
 * @brief Parse string to integer (surrounding whitespace allowed)
 */
[[nodiscard]] std::optional<int> ParseInt(std::string_view str) noexcept;

/**
 * @brief Parse string to double (surrounding whitespace allowed)
 *
 * Accepts decimal and exponent notation plus "inf"/"nan". The whole
 * trimmed string must be consumed.
 */
[[nodiscard]] std::optional<double> ParseDouble(std::string_view str) noexcept;

/**
 * @brief Format a double with the shortest representation that round-trips
 *
 * Integral values print without a fractional part ("42", not "42.0").
 */
[[nodiscard]] std::string FormatNumber(double value);

/**
 * @brief Count the digits after the decimal point in FormatNumber-style
 *        fixed notation (shortest round-trip)
 */
[[nodiscard]] int CountDecimalDigits(double value);

/**
 * @brief Percent-encode a query component (application/x-www-form-urlencoded)
 */
[[nodiscard]] std::string UrlEncode(std::string_view str);

/**
 * @brief Decode a percent-encoded query component ('+' decodes to space)
 */
[[nodiscard]] std::string UrlDecode(std::string_view str);

} // namespace StringUtils

} // namespace GeoKit
