/*

throwing.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Exception flavour of the parsing API, for callers that configure a mailer once at startup and treat a bad URI as
fatal.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <smtpuri/config.hpp>
#include <smtpuri/detail/result.hpp>
#include <smtpuri/parse.hpp>
#include <smtpuri/smtp/uri.hpp>

#if !SMTPURI_THROWING_ENABLED
#error "SMTPURI_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

namespace smtpuri
{

/**
Error of a `result` turned into an exception; `what()` is the error message.
**/
class exception : public std::runtime_error
{
public:

    explicit exception(error_info info)
        : std::runtime_error(info.message.empty() ? std::string(to_string(info.code)) : info.message),
          info_(std::move(info))
    {
    }

    [[nodiscard]] errc code() const noexcept
    {
        return info_.code;
    }

    [[nodiscard]] const error_info& info() const noexcept
    {
        return info_;
    }

private:

    error_info info_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

/**
Parsing any URI string.

@throw exception Malformed URI or unsupported `smtp*` scheme.
**/
[[nodiscard]] inline any_uri parse_or_throw(std::string_view text)
{
    return unwrap(parse(text));
}

/**
Parsing an SMTP URI.

@throw exception Malformed URI, or a scheme not based on `smtp`/`smtps`.
**/
[[nodiscard]] inline smtp::uri parse_smtp_or_throw(std::string_view text)
{
    return unwrap(smtp::uri::parse(text));
}

} // namespace smtpuri
