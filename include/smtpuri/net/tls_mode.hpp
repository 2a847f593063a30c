#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace smtpuri::net
{

/**
TLS mode of an SMTP submission connection.
**/
enum class tls_mode
{
    none,
    starttls,
    implicit
};

/// Submission port over implicit TLS (RFC 8314).
inline constexpr std::uint16_t SUBMISSIONS_PORT = 465;

/// Message submission port (RFC 6409).
inline constexpr std::uint16_t SUBMISSION_PORT = 587;

/// Plain SMTP relay port, used for local development servers.
inline constexpr std::uint16_t SMTP_PORT = 25;

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

/**
Port a submission client connects to when none is given.
**/
[[nodiscard]] constexpr std::uint16_t default_submission_port(tls_mode mode) noexcept
{
    return mode == tls_mode::implicit ? SUBMISSIONS_PORT : SUBMISSION_PORT;
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

} // namespace smtpuri::net
