/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process wide logger of smtpuri. Records go to stderr unless a callback is installed; nothing below `info` is
written by default. Messages never carry credentials, URIs are logged in their redacted form.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace smtpuri::log
{

enum class level : std::uint8_t
{
    trace = 0,
    debug = 1,   ///< Routing, rejection and ignored parts of URIs
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/**
Level by its lower case name, as given on a command line or in a config file.
**/
[[nodiscard]] constexpr std::optional<level> level_from_string(std::string_view name) noexcept
{
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
    {
        const auto upper = level_to_string(lvl);
        if (name.size() != upper.size())
            continue;
        bool same = true;
        for (std::size_t i = 0; i < name.size() && same; ++i)
            same = name[i] == static_cast<char>(upper[i] - 'A' + 'a');
        if (same)
            return lvl;
    }
    return std::nullopt;
}

class logger
{
public:

    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /**
    Installing a sink in place of stderr.

    @return Previously installed sink, empty for stderr.
    **/
    callback_t set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        return std::exchange(callback_, std::move(cb));
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc
        };

        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            write_stderr(e);
    }

private:

    logger() = default;

    static void write_stderr(const entry& e)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] smtpuri: {}\n",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(), level_to_string(e.lvl), e.message);
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

/**
Sink and level installed for the lifetime of the object; the previous ones are restored afterwards.
**/
class scoped_sink
{
public:

    scoped_sink(level lvl, callback_t cb)
        : previous_level_(logger::instance().get_level()),
          previous_callback_(logger::instance().set_callback(std::move(cb)))
    {
        logger::instance().set_level(lvl);
    }

    scoped_sink(const scoped_sink&) = delete;

    scoped_sink& operator=(const scoped_sink&) = delete;

    ~scoped_sink()
    {
        logger::instance().set_level(previous_level_);
        logger::instance().set_callback(std::move(previous_callback_));
    }

private:

    level previous_level_;
    callback_t previous_callback_;
};

// The message expression is only evaluated when the level is enabled.
#define SMTPURI_LOG(lvl, msg) \
    do \
    { \
        auto& smtpuri_logger_ = ::smtpuri::log::logger::instance(); \
        if (smtpuri_logger_.is_enabled(lvl)) \
            smtpuri_logger_.log(lvl, msg, std::source_location::current()); \
    } while (false)

#define SMTPURI_TRACE(msg)  SMTPURI_LOG(::smtpuri::log::level::trace, msg)
#define SMTPURI_DEBUG(msg)  SMTPURI_LOG(::smtpuri::log::level::debug, msg)
#define SMTPURI_INFO(msg)   SMTPURI_LOG(::smtpuri::log::level::info, msg)
#define SMTPURI_WARN(msg)   SMTPURI_LOG(::smtpuri::log::level::warn, msg)
#define SMTPURI_ERROR(msg)  SMTPURI_LOG(::smtpuri::log::level::error, msg)
#define SMTPURI_FATAL(msg)  SMTPURI_LOG(::smtpuri::log::level::fatal, msg)

} // namespace smtpuri::log
