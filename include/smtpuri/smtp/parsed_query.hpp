/*

parsed_query.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <climits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <smtpuri/detail/ascii.hpp>
#include <smtpuri/detail/result.hpp>
#include <smtpuri/smtp/types.hpp>
#include <smtpuri/uri/query.hpp>

namespace smtpuri
{
namespace smtp
{

/**
Recognized query settings after coercion. Blank values count as absent; unknown keys are ignored.
**/
struct parsed_query
{
    std::optional<std::string> auth;
    std::optional<std::string> domain;
    std::optional<starttls_mode> starttls;
    std::optional<int> read_timeout;
    std::optional<int> open_timeout;

    bool operator==(const parsed_query&) const = default;
};

namespace detail
{

    /**
    Leading integer of the text: optional sign and digits after leading whitespace. Text without digits gives 0,
    values beyond the range of int saturate.
    **/
    [[nodiscard]] inline int leading_int(std::string_view text) noexcept
    {
        std::size_t i = 0;
        while (i < text.size() && (text[i] == ' ' || (text[i] >= '\t' && text[i] <= '\r')))
            ++i;

        bool negative = false;
        if (i < text.size() && (text[i] == '+' || text[i] == '-'))
        {
            negative = text[i] == '-';
            ++i;
        }

        long long value = 0;
        for (; i < text.size() && smtpuri::detail::is_ascii_digit(text[i]); ++i)
        {
            value = value * 10 + (text[i] - '0');
            if (value > static_cast<long long>(INT_MAX) + 1)
                break;
        }
        if (negative)
            value = -value;
        if (value > INT_MAX)
            return INT_MAX;
        if (value < INT_MIN)
            return INT_MIN;
        return static_cast<int>(value);
    }

    [[nodiscard]] inline starttls_mode coerce_starttls(std::string_view value) noexcept
    {
        if (value == "auto")
            return starttls_mode::automatic;
        if (value == "false")
            return starttls_mode::off;
        return starttls_mode::always;
    }

    [[nodiscard]] inline std::optional<std::string> present_field(const smtpuri::uri::form_fields& fields, std::string_view key)
    {
        auto it = fields.find(key);
        if (it == fields.end() || smtpuri::detail::is_blank(it->second))
            return std::nullopt;
        return it->second;
    }

} // namespace detail

[[nodiscard]] inline result<parsed_query> parse_query(std::string_view raw_query)
{
    auto fields = smtpuri::uri::decode_www_form(raw_query);
    if (!fields)
        return std::unexpected(std::move(fields.error()));

    parsed_query parsed;
    parsed.auth = detail::present_field(*fields, "auth");
    parsed.domain = detail::present_field(*fields, "domain");
    if (auto value = detail::present_field(*fields, "starttls"))
        parsed.starttls = detail::coerce_starttls(*value);
    if (auto value = detail::present_field(*fields, "read_timeout"))
        parsed.read_timeout = detail::leading_int(*value);
    if (auto value = detail::present_field(*fields, "open_timeout"))
        parsed.open_timeout = detail::leading_int(*value);
    return parsed;
}

} // namespace smtp
} // namespace smtpuri
