/*

import.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Pulls in smtpuri either as the `smtpuri` module (`SMTPURI_USE_MODULES`, needs the target built with
`SMTPURI_BUILD_MODULES`) or as the umbrella header.

*/

#pragma once

#if defined(SMTPURI_USE_MODULES)
import smtpuri;
#else
#include <smtpuri/smtpuri.hpp>
#endif
