/*

scheme.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace smtpuri
{
namespace smtp
{

inline constexpr std::string_view SMTP_SCHEME = "smtp";
inline constexpr std::string_view SMTPS_SCHEME = "smtps";
inline constexpr std::string_view INSECURE_MODIFIER = "insecure";

/**
Scheme split on `+`, e.g. `smtps+insecure+login` gives base `smtps`, modifiers `[login]`, insecure and tls.
**/
struct scheme_parts
{
    /// First segment, `smtp` or `smtps` for a supported scheme.
    std::string base;

    /// Segments other than `smtp`, `smtps` and `insecure`, in order.
    std::vector<std::string> modifiers;

    /// Scheme starts with `smtps`.
    bool tls = false;

    /// `insecure` appears as a segment.
    bool insecure = false;

    [[nodiscard]] bool is_supported() const noexcept
    {
        return base == SMTP_SCHEME || base == SMTPS_SCHEME;
    }

    /// First modifier, the authentication token.
    [[nodiscard]] std::optional<std::string> auth() const
    {
        if (modifiers.empty())
            return std::nullopt;
        return modifiers.front();
    }

    bool operator==(const scheme_parts&) const = default;
};

[[nodiscard]] inline bool is_reserved_segment(std::string_view segment) noexcept
{
    return segment == SMTP_SCHEME || segment == SMTPS_SCHEME || segment == INSECURE_MODIFIER;
}

[[nodiscard]] inline scheme_parts decompose_scheme(std::string_view scheme)
{
    scheme_parts parts;
    parts.tls = scheme.starts_with(SMTPS_SCHEME);

    const std::string text(scheme);
    std::vector<std::string> segments;
    boost::split(segments, text, boost::is_any_of("+"));
    if (!segments.empty())
        parts.base = segments.front();

    parts.insecure = std::find(segments.begin(), segments.end(), INSECURE_MODIFIER) != segments.end();
    for (std::size_t i = 1; i < segments.size(); ++i)
    {
        if (segments[i].empty() || is_reserved_segment(segments[i]))
            continue;
        parts.modifiers.push_back(std::move(segments[i]));
    }
    return parts;
}

} // namespace smtp
} // namespace smtpuri
