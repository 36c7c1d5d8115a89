//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_STRING_UTILS_HPP
#define SASA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the lexer, the analyzers and the CLI.
 *
 * SAS identifiers are case-insensitive, so most comparisons in the analyzers
 * go through iequals() or an upper-cased key.
 */

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>

namespace sasa::string_utils {

    inline constexpr std::string_view whitespace = " \t\n\r\f\v";

    inline std::string_view trim_left(const std::string_view s) noexcept {
        const auto first = s.find_first_not_of(whitespace);
        return first == std::string_view::npos ? std::string_view{} : s.substr(first);
    }

    inline std::string_view trim_right(const std::string_view s) noexcept {
        const auto last = s.find_last_not_of(whitespace);
        return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_right(trim_left(s));
    }

    inline bool is_blank(const std::string_view s) noexcept {
        return s.find_first_not_of(whitespace) == std::string_view::npos;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    inline std::string to_upper(const std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (const unsigned char c : s) {
            out.push_back(static_cast<char>(std::toupper(c)));
        }
        return out;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (const unsigned char c : s) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        return out;
    }

    /// ASCII case-insensitive equality, the rule for SAS names and keywords.
    inline bool iequals(const std::string_view a, const std::string_view b) noexcept {
        return std::ranges::equal(a, b, [](const unsigned char x, const unsigned char y) {
            return std::toupper(x) == std::toupper(y);
        });
    }

    /// Drops one pair of matching quotes around the trimmed text.
    inline std::string_view unquote(std::string_view s) noexcept {
        s = trim(s);
        const bool quoted = s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
        return quoted ? s.substr(1, s.size() - 2) : s;
    }

    /**
     * Checks that @p s is well-formed UTF-8: no stray continuation bytes,
     * no overlong two-byte leads and no truncated sequences.
     */
    inline bool is_valid_utf8(const std::string_view s) noexcept {
        std::size_t pending = 0;
        for (const unsigned char c : s) {
            if (pending > 0) {
                if ((c & 0xC0) != 0x80) {
                    return false;
                }
                --pending;
            } else if (c >= 0x80) {
                if (c >= 0xC2 && c <= 0xDF) {
                    pending = 1;
                } else if ((c & 0xF0) == 0xE0) {
                    pending = 2;
                } else if (c >= 0xF0 && c <= 0xF4) {
                    pending = 3;
                } else {
                    return false;
                }
            }
        }
        return pending == 0;
    }

    /// Human readable duration: "42ns", "3.10us", "250.00ms", "1.50s".
    inline std::string format_duration(const long long nanoseconds) {
        struct Unit { long long scale; const char* suffix; };
        constexpr std::array<Unit, 3> units{{{1000000000LL, "s"}, {1000000LL, "ms"}, {1000LL, "us"}}};

        std::ostringstream oss;
        for (const auto& [scale, suffix] : units) {
            if (nanoseconds >= scale) {
                oss.setf(std::ios::fixed);
                oss.precision(2);
                oss << static_cast<double>(nanoseconds) / static_cast<double>(scale) << suffix;
                return oss.str();
            }
        }
        oss << nanoseconds << "ns";
        return oss.str();
    }

}  // namespace sasa::string_utils

#endif //SASA_STRING_UTILS_HPP
