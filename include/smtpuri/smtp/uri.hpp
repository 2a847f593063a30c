/*

uri.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <smtpuri/codec/percent.hpp>
#include <smtpuri/detail/ascii.hpp>
#include <smtpuri/detail/log.hpp>
#include <smtpuri/detail/redact.hpp>
#include <smtpuri/detail/result.hpp>
#include <smtpuri/detail/timeout_config.hpp>
#include <smtpuri/config.hpp>
#include <smtpuri/net/tls_mode.hpp>
#include <smtpuri/smtp/parsed_query.hpp>
#include <smtpuri/smtp/scheme.hpp>
#include <smtpuri/smtp/settings.hpp>
#include <smtpuri/smtp/types.hpp>
#include <smtpuri/uri/generic_uri.hpp>

namespace smtpuri
{
namespace smtp
{

inline constexpr std::string_view LOCALHOST = "localhost";
inline constexpr std::string_view LOOPBACK_IPV4 = "127.0.0.1";

/**
SMTP submission URI, `smtp[s][+insecure][+<auth>]://[user[:password]@]host[:port][?query][#domain]`.

The value is immutable; every setting is derived from the parsed components on access. Scheme, query and
userinfo are decoded once when the URI is built.
**/
class SMTPURI_EXPORT uri
{
public:

    /**
    Parsing an SMTP URI.

    @param text URI text.
    @return     The URI; `errc::uri_malformed` from the generic parser as is, or `errc::uri_unsupported_scheme` when
                the scheme is not based on `smtp`/`smtps`.
    **/
    [[nodiscard]] static result<uri> parse(std::string_view text)
    {
        auto generic = smtpuri::uri::generic_uri::parse(text);
        if (!generic)
        {
            SMTPURI_DEBUG(std::format("SMTP URI rejected: {}", generic.error().message));
            return std::unexpected(std::move(generic.error()));
        }
        return from_generic(std::move(*generic));
    }

    /**
    Building an SMTP URI from an already split one.
    **/
    [[nodiscard]] static result<uri> from_generic(smtpuri::uri::generic_uri generic)
    {
        scheme_parts scheme = decompose_scheme(generic.scheme());
        if (!scheme.is_supported())
            return fail<uri>(errc::uri_unsupported_scheme,
                "Unsupported scheme \"" + generic.scheme() + "\". Should be based on smtp or smtps.");
        if (scheme.modifiers.size() > 1)
            SMTPURI_DEBUG(std::format("Scheme {}: only the first modifier \"{}\" selects authentication, the rest is ignored.",
                generic.scheme(), scheme.modifiers.front()));

        auto query = parse_query(generic.query().value_or(std::string{}));
        if (!query)
            return std::unexpected(std::move(query.error()));
        auto user = decode_userinfo_part(generic.user());
        if (!user)
            return std::unexpected(std::move(user.error()));
        auto password = decode_userinfo_part(generic.password());
        if (!password)
            return std::unexpected(std::move(password.error()));

        uri out;
        out.generic_ = std::move(generic);
        out.scheme_ = std::move(scheme);
        out.query_ = std::move(*query);
        out.user_ = std::move(*user);
        out.password_ = std::move(*password);
        return out;
    }

    [[nodiscard]] const smtpuri::uri::generic_uri& generic() const noexcept { return generic_; }

    [[nodiscard]] const std::string& scheme() const noexcept { return generic_.scheme(); }

    [[nodiscard]] const scheme_parts& scheme_info() const noexcept { return scheme_; }

    [[nodiscard]] const parsed_query& query() const noexcept { return query_; }

    /**
    Host, absent when missing or empty.
    **/
    [[nodiscard]] std::optional<std::string> host() const
    {
        const auto& host = generic_.host();
        if (!host || host->empty())
            return std::nullopt;
        return host;
    }

    [[nodiscard]] const std::optional<std::string>& fragment() const noexcept { return generic_.fragment(); }

    [[nodiscard]] bool tls() const noexcept { return scheme_.tls; }

    [[nodiscard]] bool insecure() const noexcept { return scheme_.insecure; }

    [[nodiscard]] bool host_local() const noexcept
    {
        const auto& host = generic_.host();
        return host && (*host == LOOPBACK_IPV4 || *host == LOCALHOST);
    }

    /**
    Port written in the URI, else 25 for a local host, 465 with implicit TLS and 587 otherwise.
    **/
    [[nodiscard]] std::uint16_t port() const noexcept
    {
        if (const auto explicit_port = generic_.port())
            return *explicit_port;
        if (host_local())
            return net::SMTP_PORT;
        return net::default_submission_port(tls() ? net::tls_mode::implicit : net::tls_mode::none);
    }

    /**
    STARTTLS mode. Implicit TLS turns it off, then the `starttls` query value applies, then local hosts and
    `insecure` schemes turn it off; the default is `always`.
    **/
    [[nodiscard]] starttls_mode starttls() const noexcept
    {
        if (tls())
            return starttls_mode::off;
        if (query_.starttls)
            return *query_.starttls;
        if (host_local())
            return starttls_mode::off;
        if (insecure())
            return starttls_mode::off;
        return starttls_mode::always;
    }

    /**
    Authentication mode, absent without credentials. The `auth` query value beats the scheme modifier, `none`
    from either source disables authentication and `plain` is the default.
    **/
    [[nodiscard]] std::optional<std::string> auth() const
    {
        if (!has_credentials())
            return std::nullopt;
        if (query_.auth)
        {
            if (*query_.auth == "none")
                return std::nullopt;
            return query_.auth;
        }
        const auto scheme_auth = scheme_.auth();
        if (scheme_auth)
        {
            if (*scheme_auth == "none")
                return std::nullopt;
            return scheme_auth;
        }
        return "plain";
    }

    /**
    Sender domain from the `domain` query value, else from the fragment.
    **/
    [[nodiscard]] std::optional<std::string> domain() const
    {
        if (query_.domain)
            return query_.domain;
        const auto& fragment = generic_.fragment();
        if (!fragment || fragment->empty())
            return std::nullopt;
        return fragment;
    }

    [[nodiscard]] std::optional<int> read_timeout() const noexcept { return query_.read_timeout; }

    [[nodiscard]] std::optional<int> open_timeout() const noexcept { return query_.open_timeout; }

    [[nodiscard]] const std::optional<std::string>& decoded_user() const noexcept { return user_; }

    [[nodiscard]] const std::optional<std::string>& decoded_password() const noexcept { return password_; }

    [[nodiscard]] bool has_credentials() const noexcept { return user_.has_value() || password_.has_value(); }

    /**
    Decoded userinfo as `user:password`; a missing side is left out together with the colon.
    **/
    [[nodiscard]] std::optional<std::string> decoded_userinfo() const
    {
        if (!has_credentials())
            return std::nullopt;
        if (user_ && password_)
            return *user_ + ":" + *password_;
        return user_ ? *user_ : *password_;
    }

    [[nodiscard]] std::optional<userinfo_pair> decoded_userinfo_array() const
    {
        if (!has_credentials())
            return std::nullopt;
        return userinfo_pair{user_, password_};
    }

    [[nodiscard]] std::optional<userinfo_hash> decoded_userinfo_hash() const
    {
        if (!has_credentials())
            return std::nullopt;
        userinfo_hash out;
        if (user_)
            out.emplace("user", *user_);
        if (password_)
            out.emplace("password", *password_);
        return out;
    }

    [[nodiscard]] std::optional<userinfo_value> decoded_userinfo(userinfo_format format) const
    {
        switch (format)
        {
            case userinfo_format::string:
                if (auto value = decoded_userinfo())
                    return userinfo_value{std::move(*value)};
                return std::nullopt;
            case userinfo_format::array:
                if (auto value = decoded_userinfo_array())
                    return userinfo_value{std::move(*value)};
                return std::nullopt;
            case userinfo_format::hash:
                if (auto value = decoded_userinfo_hash())
                    return userinfo_value{std::move(*value)};
                return std::nullopt;
        }
        return std::nullopt;
    }

    /**
    Decoded userinfo in the named format, `string`, `array` or `hash`.

    @return `errc::invalid_argument` naming the format when it is unknown.
    **/
    [[nodiscard]] result<std::optional<userinfo_value>> decoded_userinfo(std::string_view format) const
    {
        auto fmt = parse_userinfo_format(format);
        if (!fmt)
            return std::unexpected(std::move(fmt.error()));
        return decoded_userinfo(*fmt);
    }

    /**
    Projection of the settings into a map, leaving out absent values.
    **/
    [[nodiscard]] config_map to_config(config_format format = config_format::standard) const
    {
        if (format == config_format::action_mailer)
            return to_action_mailer_config();
        return to_standard_config();
    }

    [[nodiscard]] result<config_map> to_config(std::string_view format) const
    {
        auto fmt = parse_config_format(format);
        if (!fmt)
            return std::unexpected(std::move(fmt.error()));
        return to_config(*fmt);
    }

    [[nodiscard]] client_settings to_client_settings() const
    {
        client_settings settings;
        settings.host = host().value_or(std::string{});
        settings.port = port();

        const starttls_mode mode = starttls();
        if (tls())
            settings.tls = net::tls_mode::implicit;
        else if (mode == starttls_mode::always)
            settings.tls = net::tls_mode::starttls;
        else
            settings.tls = net::tls_mode::none;
        settings.auto_starttls = mode == starttls_mode::automatic;

        settings.auth = auth();
        if (settings.auth)
        {
            settings.method = auth_method_from_string(*settings.auth);
            settings.user = user_;
            settings.password = password_;
        }
        settings.domain = domain();
        settings.timeouts = timeout_config::from_seconds(open_timeout(), read_timeout());
        return settings;
    }

    /**
    URI text with the password replaced by `<redacted>`, safe for logs.
    **/
    [[nodiscard]] std::string to_redacted_string() const
    {
        std::string out = generic_.scheme();
        out += ':';
        if (generic_.has_authority())
        {
            out += "//";
            if (const auto& userinfo = generic_.userinfo())
            {
                out += smtpuri::detail::redact_userinfo(*userinfo);
                out += '@';
            }
            out += *generic_.host();
            if (const auto explicit_port = generic_.port())
            {
                out += ':';
                out += std::to_string(*explicit_port);
            }
        }
        out += generic_.path();
        if (const auto& query = generic_.query())
        {
            out += '?';
            out += *query;
        }
        if (const auto& fragment = generic_.fragment())
        {
            out += '#';
            out += *fragment;
        }
        return out;
    }

    bool operator==(const uri&) const = default;

private:

    uri() = default;

    [[nodiscard]] static result<std::optional<std::string>> decode_userinfo_part(const std::optional<std::string>& raw)
    {
        if (!raw || raw->empty())
            return std::optional<std::string>{};
        auto decoded = percent::try_decode(*raw);
        if (!decoded)
            return std::unexpected(std::move(decoded.error()));
        if (smtpuri::detail::is_blank(*decoded))
            return std::optional<std::string>{};
        return std::optional<std::string>{std::move(*decoded)};
    }

    [[nodiscard]] static config_value starttls_value(starttls_mode mode)
    {
        if (mode == starttls_mode::off)
            return false;
        return std::string(to_string(mode));
    }

    [[nodiscard]] config_map to_standard_config() const
    {
        config_map out;
        if (auto value = auth())
            out.emplace("auth", std::move(*value));
        if (auto value = domain())
            out.emplace("domain", std::move(*value));
        if (auto value = host())
            out.emplace("host", std::move(*value));
        if (auto value = open_timeout())
            out.emplace("open_timeout", *value);
        out.emplace("port", static_cast<int>(port()));
        if (auto value = read_timeout())
            out.emplace("read_timeout", *value);
        out.emplace("scheme", scheme());
        out.emplace("starttls", starttls_value(starttls()));
        out.emplace("tls", tls());

        if (out.contains("auth"))
        {
            if (user_)
                out.emplace("user", *user_);
            if (password_)
                out.emplace("password", *password_);
        }
        return out;
    }

    // mail 2.8.1 skips the (start)tls settings altogether as soon as one of them is false, so false flags are
    // left out and implicit TLS suppresses both STARTTLS flags.
    [[nodiscard]] config_map to_action_mailer_config() const
    {
        config_map out;
        if (auto value = host())
            out.emplace("address", std::move(*value));
        if (auto value = auth())
            out.emplace("authentication", std::move(*value));
        if (auto value = domain())
            out.emplace("domain", std::move(*value));
        if (auto value = open_timeout())
            out.emplace("open_timeout", *value);
        out.emplace("port", static_cast<int>(port()));
        if (auto value = read_timeout())
            out.emplace("read_timeout", *value);

        const starttls_mode mode = starttls();
        if (tls())
            out.emplace("tls", true);
        else if (mode == starttls_mode::always)
            out.emplace("enable_starttls", true);
        else if (mode == starttls_mode::automatic)
            out.emplace("enable_starttls_auto", true);

        if (out.contains("authentication"))
        {
            if (user_)
                out.emplace("user_name", *user_);
            if (password_)
                out.emplace("password", *password_);
        }
        return out;
    }

    smtpuri::uri::generic_uri generic_;
    scheme_parts scheme_;
    parsed_query query_;
    std::optional<std::string> user_;
    std::optional<std::string> password_;
};

} // namespace smtp
} // namespace smtpuri
