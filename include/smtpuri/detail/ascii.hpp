#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace smtpuri
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline std::string to_lower_copy(std::string_view sv)
    {
        std::string out;
        out.reserve(sv.size());
        for (char ch : sv)
            out.push_back(ascii_tolower(ch));
        return out;
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0 || c == '\0'; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    // Empty, or whitespace only.
    [[nodiscard]] inline bool is_blank(std::string_view sv) noexcept
    {
        return trim_view(sv).empty();
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    [[nodiscard]] constexpr bool is_ascii_xdigit(char c) noexcept
    {
        return is_ascii_digit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
    }

} // namespace detail
} // namespace smtpuri
