/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <smtpuri/codec/codec.hpp>
#include <smtpuri/detail/ascii.hpp>
#include <smtpuri/detail/result.hpp>
#include <smtpuri/config.hpp>


namespace smtpuri
{


/**
Percent encoding and decoding of URI components as described in RFC 3986 section 2.1.

Decoding optionally maps `+` to a space, which is the `application/x-www-form-urlencoded` flavour used by
query strings.
**/
class SMTPURI_EXPORT percent : public codec
{
public:

    percent() = delete;

    /**
    Decoding a percent encoded string without throwing.

    @param txt           String to decode.
    @param plus_as_space Whether `+` decodes to a space.
    @return              Decoded string, or `errc::codec_bad_escape` naming the offset of the broken escape.
    **/
    [[nodiscard]] static result<std::string> try_decode(std::string_view txt, bool plus_as_space = false)
    {
        std::string dec_text;
        dec_text.reserve(txt.size());
        for (std::string_view::size_type i = 0; i < txt.size(); ++i)
        {
            const char ch = txt[i];
            if (ch == PERCENT_HEX_FLAG)
            {
                if (i + 2 >= txt.size())
                    return fail<std::string>(errc::codec_bad_escape, "Bad character.",
                        "truncated escape at offset " + std::to_string(i));
                if (!detail::is_ascii_xdigit(txt[i + 1]) || !detail::is_ascii_xdigit(txt[i + 2]))
                    return fail<std::string>(errc::codec_bad_escape, "Bad character.",
                        "invalid escape at offset " + std::to_string(i));

                const int nc_val = hex_digit_to_int(txt[i + 1]);
                const int nnc_val = hex_digit_to_int(txt[i + 2]);
                dec_text += static_cast<char>((nc_val << 4) + nnc_val);
                i += 2;
            }
            else if (plus_as_space && ch == PLUS_CHAR)
                dec_text += SPACE_CHAR;
            else
                dec_text += ch;
        }
        return dec_text;
    }

    /**
    Decoding a percent encoded string.

    @param txt String to decode.
    @return    Decoded string.
    @throw     codec_error Bad percent escape.
    **/
    [[nodiscard]] static std::string decode(std::string_view txt)
    {
        auto dec = try_decode(txt);
        if (!dec)
            throw codec_error(dec.error().message);
        return std::move(*dec);
    }

    /**
    Encoding a URI component, leaving unreserved characters and the given extra characters as they are.

    @param txt  String to encode.
    @param keep Characters which are allowed verbatim in the target component.
    @return     Encoded string.
    **/
    [[nodiscard]] static std::string encode_component(std::string_view txt, std::string_view keep = {})
    {
        std::string enc_text;
        enc_text.reserve(txt.size());
        for (char ch : txt)
        {
            if (is_unreserved(ch) || keep.find(ch) != std::string_view::npos)
            {
                enc_text += ch;
                continue;
            }
            const auto byte = static_cast<unsigned char>(ch);
            enc_text += PERCENT_HEX_FLAG;
            enc_text += int_to_hex_digit(byte >> 4);
            enc_text += int_to_hex_digit(byte);
        }
        return enc_text;
    }

    /**
    RFC 3986 unreserved set.
    **/
    [[nodiscard]] static constexpr bool is_unreserved(char ch) noexcept
    {
        return detail::is_ascii_alnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
    }
};


} // namespace smtpuri
