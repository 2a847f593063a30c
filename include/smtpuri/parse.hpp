/*

parse.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Single entry point for URI strings: SMTP URIs get the SMTP type, every other
URI is split generically and returned unchanged.

*/

#pragma once

#include <format>
#include <string_view>
#include <utility>
#include <variant>
#include <smtpuri/detail/log.hpp>
#include <smtpuri/detail/result.hpp>
#include <smtpuri/smtp/uri.hpp>
#include <smtpuri/uri/generic_uri.hpp>

namespace smtpuri
{

using any_uri = std::variant<uri::generic_uri, smtp::uri>;

/**
Whether the text is routed to the SMTP parser: it starts with `smtp`.
**/
[[nodiscard]] constexpr bool is_smtp_uri_string(std::string_view text) noexcept
{
    return text.starts_with(smtp::SMTP_SCHEME);
}

/**
Whether a generically split URI has one of the plain SMTP scheme names, in any case.
**/
[[nodiscard]] inline bool has_registered_smtp_scheme(const uri::generic_uri& parsed) noexcept
{
    return parsed.scheme() == smtp::SMTP_SCHEME || parsed.scheme() == smtp::SMTPS_SCHEME;
}

/**
Parsing any URI string.

@param text URI text.
@return     `smtp::uri` for text starting with `smtp` and for the schemes `smtp`/`smtps` written in another case,
            `uri::generic_uri` otherwise. Errors of either parser are returned as they are.
**/
[[nodiscard]] inline result<any_uri> parse(std::string_view text)
{
    if (is_smtp_uri_string(text))
    {
        SMTPURI_DEBUG("Parsing as SMTP URI.");
        auto parsed = smtp::uri::parse(text);
        if (!parsed)
            return std::unexpected(std::move(parsed.error()));
        return any_uri{std::in_place_type<smtp::uri>, std::move(*parsed)};
    }

    auto parsed = uri::generic_uri::parse(text);
    if (!parsed)
        return std::unexpected(std::move(parsed.error()));
    if (has_registered_smtp_scheme(*parsed))
    {
        SMTPURI_DEBUG(std::format("Scheme {} is registered as SMTP.", parsed->scheme()));
        auto smtp_uri = smtp::uri::from_generic(std::move(*parsed));
        if (!smtp_uri)
            return std::unexpected(std::move(smtp_uri.error()));
        return any_uri{std::in_place_type<smtp::uri>, std::move(*smtp_uri)};
    }
    return any_uri{std::in_place_type<uri::generic_uri>, std::move(*parsed)};
}

/**
Already parsed URIs pass through untouched.
**/
[[nodiscard]] inline any_uri parse(uri::generic_uri parsed)
{
    return any_uri{std::in_place_type<uri::generic_uri>, std::move(parsed)};
}

[[nodiscard]] inline any_uri parse(smtp::uri parsed)
{
    return any_uri{std::in_place_type<smtp::uri>, std::move(parsed)};
}

} // namespace smtpuri
