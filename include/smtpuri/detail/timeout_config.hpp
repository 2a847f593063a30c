/**
 * @file timeout_config.hpp
 * @brief Connection timeouts carried by an SMTP URI.
 * @author smtpuri contributors
 *
 * The values are data for the SMTP client which opens the connection; nothing
 * here enforces them.
 */

#ifndef SMTPURI_DETAIL_TIMEOUT_CONFIG_HPP
#define SMTPURI_DETAIL_TIMEOUT_CONFIG_HPP

#include <chrono>
#include <optional>

namespace smtpuri {

using namespace std::chrono;

/**
 * Per-operation timeout configuration.
 *
 * If a specific timeout is not set, the default_timeout is used.
 *
 * Example:
 * @code
 * timeout_config timeouts;
 * timeouts.connect = seconds(10);
 * timeouts.read = seconds(30);
 * @endcode
 */
struct timeout_config
{
    /// Default timeout used when specific timeout is not set
    steady_clock::duration default_timeout{seconds(60)};

    /// TCP connection establishment timeout (`open_timeout`)
    std::optional<steady_clock::duration> connect;

    /// Read operation timeout (`read_timeout`)
    std::optional<steady_clock::duration> read;

    // ========== Getters with fallback to default ==========

    steady_clock::duration get_connect() const
    { return connect.value_or(default_timeout); }

    steady_clock::duration get_read() const
    { return read.value_or(default_timeout); }

    // ========== Factory methods ==========

    /**
     * Create configuration from optional second counts, as found in a URI query.
     */
    static timeout_config from_seconds(std::optional<int> open_timeout, std::optional<int> read_timeout)
    {
        timeout_config cfg;
        if (open_timeout)
            cfg.connect = duration_cast<steady_clock::duration>(seconds(*open_timeout));
        if (read_timeout)
            cfg.read = duration_cast<steady_clock::duration>(seconds(*read_timeout));
        return cfg;
    }

    bool operator==(const timeout_config&) const = default;
};

} // namespace smtpuri

#endif // SMTPURI_DETAIL_TIMEOUT_CONFIG_HPP
