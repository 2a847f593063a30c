#pragma once

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <smtpuri/detail/result.hpp>

namespace smtpuri
{
namespace smtp
{

/**
STARTTLS behaviour requested by a URI.
**/
enum class starttls_mode
{
    off,        ///< No in-band upgrade
    always,     ///< Upgrade, fail when the server does not offer STARTTLS
    automatic   ///< Upgrade only when the server offers STARTTLS
};

[[nodiscard]] constexpr std::string_view to_string(starttls_mode mode) noexcept
{
    switch (mode)
    {
        case starttls_mode::off: return "off";
        case starttls_mode::always: return "always";
        case starttls_mode::automatic: return "auto";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, starttls_mode mode)
{
    return os << to_string(mode);
}

enum class auth_method
{
    auto_detect,
    plain,
    login,
    xoauth2
};

[[nodiscard]] constexpr std::string_view to_string(auth_method method) noexcept
{
    switch (method)
    {
        case auth_method::auto_detect: return "auto_detect";
        case auth_method::plain: return "plain";
        case auth_method::login: return "login";
        case auth_method::xoauth2: return "xoauth2";
    }
    return "unknown";
}

/**
Mapping an auth token to a known method; custom tokens have no counterpart.
**/
[[nodiscard]] inline std::optional<auth_method> auth_method_from_string(std::string_view token) noexcept
{
    if (token == "plain")
        return auth_method::plain;
    if (token == "login")
        return auth_method::login;
    if (token == "xoauth2")
        return auth_method::xoauth2;
    return std::nullopt;
}

// ==================== Output shapes ====================

/// Value of a projection entry: flags, ports/timeouts, or text.
using config_value = std::variant<bool, int, std::string>;

/// Projection of a URI. Never holds an entry for an absent value.
using config_map = std::map<std::string, config_value, std::less<>>;

/// Decoded user and password, each absent when not supplied.
using userinfo_pair = std::pair<std::optional<std::string>, std::optional<std::string>>;

/// Decoded userinfo keyed by `user` and `password`; a key is present only with a value.
using userinfo_hash = std::map<std::string, std::string, std::less<>>;

using userinfo_value = std::variant<std::string, userinfo_pair, userinfo_hash>;

// ==================== Format selectors ====================

enum class userinfo_format
{
    string,
    array,
    hash
};

[[nodiscard]] inline result<userinfo_format> parse_userinfo_format(std::string_view name)
{
    if (name == "string")
        return userinfo_format::string;
    if (name == "array")
        return userinfo_format::array;
    if (name == "hash")
        return userinfo_format::hash;
    return fail<userinfo_format>(errc::invalid_argument,
        "Unknown format \"" + std::string(name) + "\". Should be one of [string, array, hash].");
}

enum class config_format
{
    standard,       ///< Generic keys: auth, host, port, starttls, tls, ...
    action_mailer   ///< Keys of ActionMailer smtp_settings: address, authentication, enable_starttls, ...
};

[[nodiscard]] inline result<config_format> parse_config_format(std::string_view name)
{
    if (name.empty() || name == "default")
        return config_format::standard;
    if (name == "am" || name == "action_mailer")
        return config_format::action_mailer;
    return fail<config_format>(errc::invalid_argument,
        "Unknown format \"" + std::string(name) + "\". Should be one of [default, am, action_mailer].");
}

} // namespace smtp
} // namespace smtpuri
