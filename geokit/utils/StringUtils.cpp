#include "utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>

namespace GeoKit {

namespace StringUtils {

namespace {

[[nodiscard]] std::string_view TrimView(std::string_view str) noexcept {
    const auto start = str.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = str.find_last_not_of(kWhitespace);
    return str.substr(start, end - start + 1);
}

[[nodiscard]] int HexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Shortest round-trip representation in fixed notation
[[nodiscard]] std::string ToFixedShortest(double value) {
    // Large enough for any double in fixed notation
    std::array<char, 400> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                   value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        return {};
    }
    return std::string(buffer.data(), ptr);
}

} // namespace

std::vector<std::string> Split(std::string_view str, char delimiter, size_t maxParts) {
    std::vector<std::string> tokens;
    size_t start = 0;
    size_t end = 0;

    while ((maxParts == 0 || tokens.size() + 1 < maxParts) &&
           (end = str.find(delimiter, start)) != std::string_view::npos) {
        tokens.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    tokens.emplace_back(str.substr(start));

    return tokens;
}

std::string Trim(std::string_view str) {
    return std::string(TrimView(str));
}

std::string ToLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<int> ParseInt(std::string_view str) noexcept {
    str = TrimView(str);
    int value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec == std::errc{} && ptr == str.data() + str.size()) {
        return value;
    }
    return std::nullopt;
}

std::optional<double> ParseDouble(std::string_view str) noexcept {
    str = TrimView(str);
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
    }
    if (str.empty()) {
        return std::nullopt;
    }

    double value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec == std::errc{} && ptr == str.data() + str.size()) {
        return value;
    }
    return std::nullopt;
}

std::string FormatNumber(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == 0.0) {
        return "0";  // also folds -0
    }
    return ToFixedShortest(value);
}

int CountDecimalDigits(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    const std::string text = ToFixedShortest(value);
    const auto dot = text.find('.');
    if (dot == std::string::npos) {
        return 0;
    }
    return static_cast<int>(text.size() - dot - 1);
}

std::string UrlEncode(std::string_view str) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(str.size());

    for (char ch : str) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
            result.push_back(ch);
        } else if (c == ' ') {
            result.push_back('+');
        } else {
            result.push_back('%');
            result.push_back(kHex[c >> 4]);
            result.push_back(kHex[c & 0x0F]);
        }
    }

    return result;
}

std::string UrlDecode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            result.push_back(' ');
        } else if (str[i] == '%' && i + 2 < str.size() &&
                   HexValue(str[i + 1]) >= 0 && HexValue(str[i + 2]) >= 0) {
            result.push_back(static_cast<char>(HexValue(str[i + 1]) * 16 + HexValue(str[i + 2])));
            i += 2;
        } else {
            result.push_back(str[i]);
        }
    }

    return result;
}

} // namespace StringUtils

} // namespace GeoKit
