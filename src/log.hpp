// SPDX-License-Identifier: MIT
// Logging.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstdint>
#include <format>
#include <iostream>

class Log {
public:
    /** Message severity, also used as output threshold. */
    enum class Level : uint8_t {
        Debug,
        Info,
        Warning,
        Error,
        Off,
    };

    /**
     * Print debug message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void debug(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Debug)) {
            // diagnostics, keep stdout for the program output
            std::cerr << "DEBUG: "
                      << std::vformat(fmt.get(), std::make_format_args(args...))
                      << '\n';
        }
    }

    /**
     * Print informational message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void info(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Info)) {
            std::cout << std::vformat(fmt.get(), std::make_format_args(args...))
                      << '\n';
        }
    }

    /**
     * Print warning message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void warning(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Warning)) {
            std::cerr << "WARNING: "
                      << std::vformat(fmt.get(), std::make_format_args(args...))
                      << '\n';
        }
    }

    /**
     * Print error message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void error(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::Error)) {
            std::cerr << "ERROR: "
                      << std::vformat(fmt.get(), std::make_format_args(args...))
                      << '\n';
        }
    }

    /**
     * Output threshold getter/setter.
     * @return reference to the minimal level to print
     */
    static Level& level()
    {
        static Level threshold = Level::Info;
        return threshold;
    }

    /**
     * Check if messages of specified level are printed.
     * @param lvl message level
     * @return true if message will be printed
     */
    static bool enabled(const Level lvl)
    {
        return lvl != Level::Off && lvl >= level();
    }
};
