/*

generic_uri.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

RFC 3986 splitting of a URI reference into its components. Components are kept
raw (percent-encoded); only the scheme is normalized to lower case.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <smtpuri/detail/ascii.hpp>
#include <smtpuri/detail/error_detail.hpp>
#include <smtpuri/detail/result.hpp>
#include <smtpuri/config.hpp>

namespace smtpuri
{
namespace uri
{

namespace detail
{
    [[nodiscard]] constexpr bool is_unreserved(char ch) noexcept
    {
        return smtpuri::detail::is_ascii_alnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
    }

    [[nodiscard]] constexpr bool is_sub_delim(char ch) noexcept
    {
        switch (ch)
        {
            case '!': case '$': case '&': case '\'': case '(': case ')':
            case '*': case '+': case ',': case ';': case '=':
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] constexpr bool is_scheme_char(char ch) noexcept
    {
        return smtpuri::detail::is_ascii_alnum(ch) || ch == '+' || ch == '-' || ch == '.';
    }

    [[nodiscard]] constexpr bool is_userinfo_char(char ch) noexcept
    {
        return is_unreserved(ch) || is_sub_delim(ch) || ch == ':';
    }

    [[nodiscard]] constexpr bool is_reg_name_char(char ch) noexcept
    {
        return is_unreserved(ch) || is_sub_delim(ch);
    }

    [[nodiscard]] constexpr bool is_ip_literal_char(char ch) noexcept
    {
        return is_unreserved(ch) || is_sub_delim(ch) || ch == ':';
    }

    [[nodiscard]] constexpr bool is_pchar(char ch) noexcept
    {
        return is_unreserved(ch) || is_sub_delim(ch) || ch == ':' || ch == '@';
    }

    [[nodiscard]] constexpr bool is_path_char(char ch) noexcept
    {
        return is_pchar(ch) || ch == '/';
    }

    [[nodiscard]] constexpr bool is_query_char(char ch) noexcept
    {
        return is_pchar(ch) || ch == '/' || ch == '?';
    }
} // namespace detail


/**
Generic URI reference: `scheme ":" ["//" authority] path ["?" query] ["#" fragment]`.

Absent components are `std::nullopt`; a component which is present but empty (`smtp://foo?` has an empty query)
is an empty string.
**/
class SMTPURI_EXPORT generic_uri
{
public:

    generic_uri() = default;

    /**
    Splitting the given text.

    @param text URI reference.
    @return     Parsed URI, or `errc::uri_malformed` with the offending component and position in the detail.
    **/
    [[nodiscard]] static result<generic_uri> parse(std::string_view text)
    {
        generic_uri out;
        out.text_.assign(text.data(), text.size());

        std::string_view rest = text;

        const auto hash_pos = rest.find('#');
        if (hash_pos != std::string_view::npos)
        {
            auto checked = check_component(rest.substr(hash_pos + 1), hash_pos + 1, "fragment", detail::is_query_char);
            if (!checked)
                return std::unexpected(std::move(checked.error()));
            out.fragment_.emplace(rest.substr(hash_pos + 1));
            rest = rest.substr(0, hash_pos);
        }

        const auto query_pos = rest.find('?');
        if (query_pos != std::string_view::npos)
        {
            auto checked = check_component(rest.substr(query_pos + 1), query_pos + 1, "query", detail::is_query_char);
            if (!checked)
                return std::unexpected(std::move(checked.error()));
            out.query_.emplace(rest.substr(query_pos + 1));
            rest = rest.substr(0, query_pos);
        }

        std::size_t offset = 0;
        const auto colon_pos = rest.find(':');
        const auto slash_pos = rest.find('/');
        if (colon_pos != std::string_view::npos && (slash_pos == std::string_view::npos || colon_pos < slash_pos))
        {
            const std::string_view scheme = rest.substr(0, colon_pos);
            if (scheme.empty() || !smtpuri::detail::is_ascii_alpha(scheme.front()))
                return malformed("scheme", 0, "scheme must start with a letter");
            for (std::size_t i = 0; i < scheme.size(); ++i)
            {
                if (!detail::is_scheme_char(scheme[i]))
                    return malformed("scheme", i, "invalid scheme character", scheme[i]);
            }
            out.scheme_ = smtpuri::detail::to_lower_copy(scheme);
            offset = colon_pos + 1;
            rest = rest.substr(colon_pos + 1);
        }

        if (rest.starts_with("//"))
        {
            rest.remove_prefix(2);
            offset += 2;
            const auto path_pos = rest.find('/');
            const std::string_view authority = rest.substr(0, path_pos);
            auto parsed = out.parse_authority(authority, offset);
            if (!parsed)
                return std::unexpected(std::move(parsed.error()));
            offset += authority.size();
            rest = path_pos == std::string_view::npos ? std::string_view{} : rest.substr(path_pos);
        }

        auto checked = check_component(rest, offset, "path", detail::is_path_char);
        if (!checked)
            return std::unexpected(std::move(checked.error()));
        out.path_.assign(rest.data(), rest.size());

        return out;
    }

    /**
    Source text as given to `parse()`.
    **/
    [[nodiscard]] const std::string& str() const noexcept { return text_; }

    /**
    Lower cased scheme, empty for a relative reference.
    **/
    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }

    [[nodiscard]] const std::optional<std::string>& userinfo() const noexcept { return userinfo_; }

    [[nodiscard]] const std::optional<std::string>& host() const noexcept { return host_; }

    /**
    Port, present only when written in the source text.
    **/
    [[nodiscard]] std::optional<std::uint16_t> port() const noexcept { return port_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] const std::optional<std::string>& query() const noexcept { return query_; }

    [[nodiscard]] const std::optional<std::string>& fragment() const noexcept { return fragment_; }

    /**
    Raw user part of the userinfo, the text before the first colon.
    **/
    [[nodiscard]] std::optional<std::string> user() const
    {
        if (!userinfo_)
            return std::nullopt;
        return userinfo_->substr(0, userinfo_->find(':'));
    }

    /**
    Raw password part of the userinfo, the text after the first colon; absent when there is no colon.
    **/
    [[nodiscard]] std::optional<std::string> password() const
    {
        if (!userinfo_)
            return std::nullopt;
        const auto pos = userinfo_->find(':');
        if (pos == std::string::npos)
            return std::nullopt;
        return userinfo_->substr(pos + 1);
    }

    [[nodiscard]] bool has_authority() const noexcept { return host_.has_value(); }

    [[nodiscard]] bool is_relative() const noexcept { return scheme_.empty(); }

    bool operator==(const generic_uri&) const = default;

private:

    [[nodiscard]] static std::unexpected<error_info> malformed(std::string_view component, std::size_t position,
        std::string_view reason, std::optional<char> offending = std::nullopt)
    {
        smtpuri::detail::error_detail detail;
        detail.add("component", component).add_int("position", position);
        if (offending)
            detail.add_char("char", *offending);
        detail.add("reason", reason);
        return smtpuri::detail::make_unexpected(make_error(errc::uri_malformed,
            "Malformed URI: " + std::string(reason) + " in " + std::string(component) + ".", detail.str()));
    }

    /**
    Checking that every character of the component is allowed and that percent escapes are complete.
    **/
    [[nodiscard]] static result<void> check_component(std::string_view value, std::size_t offset,
        std::string_view component, bool (*allowed)(char) noexcept)
    {
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            const char ch = value[i];
            if (ch == '%')
            {
                if (i + 2 >= value.size())
                    return malformed(component, offset + i, "truncated percent escape");
                if (!smtpuri::detail::is_ascii_xdigit(value[i + 1]) || !smtpuri::detail::is_ascii_xdigit(value[i + 2]))
                    return malformed(component, offset + i, "invalid percent escape");
                i += 2;
                continue;
            }
            if (!allowed(ch))
                return malformed(component, offset + i, "invalid character", ch);
        }
        return ok();
    }

    result<void> parse_authority(std::string_view authority, std::size_t offset)
    {
        const auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos)
        {
            const std::string_view userinfo = authority.substr(0, at_pos);
            auto checked = check_component(userinfo, offset, "userinfo", detail::is_userinfo_char);
            if (!checked)
                return checked;
            userinfo_.emplace(userinfo);
            authority.remove_prefix(at_pos + 1);
            offset += at_pos + 1;
        }

        std::string_view host;
        std::string_view port;
        bool has_port = false;
        if (authority.starts_with('['))
        {
            const auto close_pos = authority.find(']');
            if (close_pos == std::string_view::npos)
                return malformed("host", offset, "unterminated IP literal");
            host = authority.substr(0, close_pos + 1);
            auto checked = check_component(host.substr(1, host.size() - 2), offset + 1, "host",
                detail::is_ip_literal_char);
            if (!checked)
                return checked;
            const std::string_view tail = authority.substr(close_pos + 1);
            if (!tail.empty())
            {
                if (tail.front() != ':')
                    return malformed("host", offset + close_pos + 1, "unexpected text after IP literal", tail.front());
                port = tail.substr(1);
                has_port = true;
            }
        }
        else
        {
            const auto colon_pos = authority.rfind(':');
            host = authority.substr(0, colon_pos);
            if (colon_pos != std::string_view::npos)
            {
                port = authority.substr(colon_pos + 1);
                has_port = true;
            }
            auto checked = check_component(host, offset, "host", detail::is_reg_name_char);
            if (!checked)
                return checked;
        }
        host_.emplace(host);

        if (has_port && !port.empty())
        {
            const std::size_t port_offset = offset + host.size() + 1;
            for (std::size_t i = 0; i < port.size(); ++i)
            {
                if (!smtpuri::detail::is_ascii_digit(port[i]))
                    return malformed("port", port_offset + i, "port must be numeric", port[i]);
            }
            unsigned long value = 0;
            const auto res = std::from_chars(port.data(), port.data() + port.size(), value);
            if (res.ec != std::errc{} || value > 65535)
                return malformed("port", port_offset, "port out of range");
            port_ = static_cast<std::uint16_t>(value);
        }
        return ok();
    }

    std::string text_;
    std::string scheme_;
    std::optional<std::string> userinfo_;
    std::optional<std::string> host_;
    std::optional<std::uint16_t> port_;
    std::string path_;
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;
};


} // namespace uri
} // namespace smtpuri
