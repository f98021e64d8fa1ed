#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <mutex>
#include <ranges>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace decaf {

    enum class log_level : uint8_t { debug, info, warn, error };

    namespace detail {
        inline std::atomic<log_level>& log_threshold() {
            static std::atomic<log_level> threshold{log_level::info};
            return threshold;
        }

        inline std::mutex& log_mutex() {
            static std::mutex m{};
            return m;
        }

        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        constexpr std::string_view level_tag(log_level level) {
            switch (level) {
                case log_level::debug:
                    return "DEBUG";
                case log_level::info:
                    return "INFO";
                case log_level::warn:
                    return "WARNING";
                case log_level::error:
                    return "ERROR";
            }
            return "INFO";
        }

        template <typename... Args>
        void emit(log_level level, const std::source_location& loc, Args&&... args) {
            if (level < log_threshold().load(std::memory_order_relaxed)) {
                return;
            }
            std::ostringstream line{};
            auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            line << std::format("{:%Y-%m-%d %H:%M:%S}", now) << " - " << level_tag(level) << " - [" << sloc_fname(loc)
                 << ':' << loc.line() << "] ";
            (line << ... << std::forward<Args>(args));
            line << '\n';

            std::lock_guard lock{log_mutex()};
            // drops a badbit left by an earlier failed write (EAGAIN on a full pipe)
            std::cerr.clear();
            std::cerr << line.str() << std::flush;
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::log_threshold().store(level, std::memory_order_relaxed);
    }

    inline log_level current_log_level() {
        return detail::log_threshold().load(std::memory_order_relaxed);
    }

    // Leveled loggers; all output goes to stderr so stdout stays reserved for protocol traffic
    template <typename... Args>
    struct log_debug {
        explicit log_debug(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::warn, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::error, loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    log_debug(Args&&...) -> log_debug<Args...>;
    template <typename... Args>
    log_info(Args&&...) -> log_info<Args...>;
    template <typename... Args>
    log_warn(Args&&...) -> log_warn<Args...>;
    template <typename... Args>
    log_error(Args&&...) -> log_error<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool ends_with_case(std::string_view text, std::string_view suffix) {
            return text.size() >= suffix.size() && str_case_eq(text.substr(text.size() - suffix.size()), suffix);
        }

        constexpr bool is_blank(std::string_view text) {
            return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace decaf
