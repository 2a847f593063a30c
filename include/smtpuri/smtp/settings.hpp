#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <smtpuri/detail/timeout_config.hpp>
#include <smtpuri/net/tls_mode.hpp>
#include <smtpuri/smtp/types.hpp>

namespace smtpuri
{
namespace smtp
{

/**
Typed connection settings for an SMTP client, derived from a URI.

Credentials are only filled when `auth` is set.
**/
struct client_settings
{
    std::string host;
    std::uint16_t port = net::SUBMISSION_PORT;
    net::tls_mode tls = net::tls_mode::starttls;

    /// Upgrade with STARTTLS only when the server offers it; `tls` is `none` then.
    bool auto_starttls = false;

    /// Auth token as written in the URI, including custom ones.
    std::optional<std::string> auth;

    /// Known counterpart of `auth`.
    std::optional<auth_method> method;

    std::optional<std::string> user;
    std::optional<std::string> password;

    /// HELO/EHLO domain.
    std::optional<std::string> domain;

    timeout_config timeouts;

    bool operator==(const client_settings&) const = default;
};

} // namespace smtp
} // namespace smtpuri
