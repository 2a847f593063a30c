/*

config.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Build switches and version of smtpuri.

    SMTPURI_NO_EXCEPTIONS   drops the exception bridge of `throwing.hpp`
    SMTPURI_HIDDEN          keeps the library types out of the dynamic symbol table

*/

#pragma once

#include <string_view>

#define SMTPURI_VERSION_MAJOR 0
#define SMTPURI_VERSION_MINOR 4
#define SMTPURI_VERSION_PATCH 0

#if defined(SMTPURI_NO_EXCEPTIONS)
#define SMTPURI_THROWING_ENABLED 0
#else
#define SMTPURI_THROWING_ENABLED 1
#endif

// Header-only: nothing is imported from a DLL, the macro only controls ELF visibility.
#ifndef SMTPURI_EXPORT
#  if defined(SMTPURI_HIDDEN) || defined(_WIN32) || defined(__CYGWIN__)
#    define SMTPURI_EXPORT
#  elif defined(__GNUC__) && __GNUC__ >= 4
#    define SMTPURI_EXPORT __attribute__((visibility("default")))
#  else
#    define SMTPURI_EXPORT
#  endif
#endif

namespace smtpuri
{

[[nodiscard]] constexpr std::string_view version() noexcept
{
    return "0.4.0";
}

} // namespace smtpuri
