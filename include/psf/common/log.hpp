/**
 * @file log.hpp
 * @brief tagged {fmt} logging helpers so pipeline breadcrumbs stay greppable uwu
 *
 * every line is prefixed with a module tag (e.g. "[psf::physics]") so stdout
 * from the CLI reads like a timeline of the solve. debug lines only show up
 * when verbose mode is toggled (config logging.verbose or --verbose).
 *
 * ⚠️ IMPURE (writes to stdout/stderr)
 *
 * example:
 * @code
 * psf::log::info("physics", "assembled {} nonzeros", nnz);
 * // [psf::physics] assembled 1234 nonzeros
 * @endcode
 */
#pragma once

#include <atomic>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace psf::log
{

namespace detail
{

inline std::atomic<bool> verbose_enabled{false};

template <typename... Args>
void emit(std::FILE *stream, std::string_view tag, fmt::format_string<Args...> format, Args &&...args)
{
    fmt::print(stream, "[psf::{}] {}\n", tag, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace detail

/**
 * @brief toggles debug-level output for the whole process
 */
inline void set_verbose(bool enabled) noexcept
{
    detail::verbose_enabled.store(enabled, std::memory_order_relaxed);
}

[[nodiscard]] inline auto verbose() noexcept -> bool
{
    return detail::verbose_enabled.load(std::memory_order_relaxed);
}

template <typename... Args>
void info(std::string_view tag, fmt::format_string<Args...> format, Args &&...args)
{
    detail::emit(stdout, tag, format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::string_view tag, fmt::format_string<Args...> format, Args &&...args)
{
    if (!verbose())
    {
        return;
    }
    detail::emit(stdout, tag, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view tag, fmt::format_string<Args...> format, Args &&...args)
{
    detail::emit(stderr, tag, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view tag, fmt::format_string<Args...> format, Args &&...args)
{
    detail::emit(stderr, tag, format, std::forward<Args>(args)...);
}

} // namespace psf::log
