#pragma once
///@file

#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace seqrt {

/**
 * Return an environment variable.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Parse a string into an integer.
 */
template<class N>
std::optional<N> string2Int(const std::string_view s)
{
    static_assert(std::is_integral_v<N>);
    if (s.substr(0, 1) == "-" && !std::numeric_limits<N>::is_signed)
        return std::nullopt;
    N n;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return n;
}

/**
 * Convert a string to upper case (ASCII only).
 */
std::string toUpper(std::string s);

/**
 * Replace all occurrences of `from` with `to` in `s`.
 */
std::string replaceStrings(std::string s, std::string_view from, std::string_view to);

} // namespace seqrt
