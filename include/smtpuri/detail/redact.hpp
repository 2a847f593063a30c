#pragma once

#include <string>
#include <string_view>

namespace smtpuri::detail
{

inline constexpr std::string_view REDACTED = "<redacted>";

/**
Raw userinfo with the password replaced, `user:pass` gives `user:<redacted>`. Userinfo without a password is
returned unchanged.
**/
[[nodiscard]] inline std::string redact_userinfo(std::string_view userinfo)
{
    const auto pos = userinfo.find(':');
    if (pos == std::string_view::npos || pos + 1 == userinfo.size())
        return std::string(userinfo);

    std::string out(userinfo.substr(0, pos + 1));
    out.append(REDACTED);
    return out;
}

} // namespace smtpuri::detail
