/*

query.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <smtpuri/codec/percent.hpp>
#include <smtpuri/detail/result.hpp>

namespace smtpuri
{
namespace uri
{

using form_fields = std::map<std::string, std::string, std::less<>>;

/**
Decoding an `application/x-www-form-urlencoded` query.

Pairs are separated by `&`, the first `=` separates name and value, a name without `=` gets an empty value and
empty pairs are skipped. When a name repeats, the last value wins.

@param query Raw query, without the leading `?`.
@return      Decoded fields, or `errc::codec_bad_escape` on a broken percent escape.
**/
[[nodiscard]] inline result<form_fields> decode_www_form(std::string_view query)
{
    form_fields fields;
    if (query.empty())
        return fields;

    const std::string text(query);
    std::vector<std::string> pairs;
    boost::split(pairs, text, boost::is_any_of("&"));
    for (const auto& pair : pairs)
    {
        if (pair.empty())
            continue;

        const auto eq_pos = pair.find('=');
        const std::string_view raw_name = std::string_view(pair).substr(0, eq_pos);
        const std::string_view raw_value = eq_pos == std::string::npos ? std::string_view{}
            : std::string_view(pair).substr(eq_pos + 1);

        auto name = percent::try_decode(raw_name, true);
        if (!name)
            return std::unexpected(std::move(name.error()));
        auto value = percent::try_decode(raw_value, true);
        if (!value)
            return std::unexpected(std::move(value.error()));

        fields.insert_or_assign(std::move(*name), std::move(*value));
    }
    return fields;
}

} // namespace uri
} // namespace smtpuri
