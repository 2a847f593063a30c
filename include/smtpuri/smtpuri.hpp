#pragma once

#include <smtpuri/config.hpp>

#include <smtpuri/codec/codec.hpp>
#include <smtpuri/codec/percent.hpp>

#include <smtpuri/detail/result.hpp>
#include <smtpuri/detail/log.hpp>

#include <smtpuri/uri/generic_uri.hpp>
#include <smtpuri/uri/query.hpp>

#include <smtpuri/net/tls_mode.hpp>

#include <smtpuri/smtp/types.hpp>
#include <smtpuri/smtp/scheme.hpp>
#include <smtpuri/smtp/parsed_query.hpp>
#include <smtpuri/smtp/settings.hpp>
#include <smtpuri/smtp/uri.hpp>

// Entry point
#include <smtpuri/parse.hpp>

// Utilities
#include <smtpuri/detail/timeout_config.hpp>
