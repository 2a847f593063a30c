/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by the smtpuri core - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace smtpuri
{

/// Error categories for smtpuri operations
enum class errc : std::uint16_t
{
    ok = 0,

    // URI grammar (100-199)
    uri_malformed = 100,
    uri_unsupported_scheme = 101,

    // Codec errors (200-299)
    codec_bad_escape = 200,

    // Input validation (700-799)
    invalid_argument = 700,

    // Internal errors (900-999)
    internal_error = 900,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::uri_malformed: return "uri_malformed";
        case errc::uri_unsupported_scheme: return "uri_unsupported_scheme";
        case errc::codec_bad_escape: return "codec_bad_escape";
        case errc::invalid_argument: return "invalid_argument";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// Rich error type with code, message, structured detail and origin
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::source_location where = std::source_location::current();

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        if (detail.empty())
            return std::format("[{}] {}", smtpuri::to_string(code), message);
        return std::format("[{}] {}: {}", smtpuri::to_string(code), message, detail);
    }

    [[nodiscard]] bool is(errc ec) const noexcept { return code == ec; }
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error_info>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), where};
}

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info info)
{
    return std::unexpected<error_info>(std::move(info));
}

} // namespace detail

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), where));
}

} // namespace smtpuri
