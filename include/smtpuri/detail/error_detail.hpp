/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builder of the `detail` text of an error: one `key=value` entry per line, in insertion order. Values are written
as given except characters, which are percent escaped unless printable.

*/

#pragma once

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

namespace smtpuri::detail
{

class error_detail
{
public:

    error_detail& add(std::string_view key, std::string_view value)
    {
        begin_entry(key);
        out_.append(value);
        out_ += '\n';
        return *this;
    }

    error_detail& add_int(std::string_view key, std::size_t value)
    {
        begin_entry(key);
        char buffer[24];
        const auto res = std::to_chars(buffer, buffer + sizeof(buffer), value);
        out_.append(buffer, res.ec == std::errc{} ? res.ptr : buffer);
        out_ += '\n';
        return *this;
    }

    /**
    Offending character; control, space, non-ASCII and `%` are written as `%XX`.
    **/
    error_detail& add_char(std::string_view key, char ch)
    {
        static constexpr char HEX[] = "0123456789ABCDEF";

        begin_entry(key);
        const auto byte = static_cast<unsigned char>(ch);
        if (byte > 0x20 && byte < 0x7F && ch != '%')
            out_ += ch;
        else
        {
            out_ += '%';
            out_ += HEX[byte >> 4];
            out_ += HEX[byte & 0x0F];
        }
        out_ += '\n';
        return *this;
    }

    [[nodiscard]] const std::string& str() const noexcept
    {
        return out_;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

private:

    void begin_entry(std::string_view key)
    {
        out_.append(key);
        out_ += '=';
    }

    std::string out_;
};

} // namespace smtpuri::detail
