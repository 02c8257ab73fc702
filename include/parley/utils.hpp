#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "info"sv;
    }

    namespace detail {
        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        inline std::atomic<log_level>& log_threshold() {
            static std::atomic<log_level> level{log_level::info};
            return level;
        }

        inline std::atomic<std::ostream*>& log_stream() {
            static std::atomic<std::ostream*> os{&std::cerr};
            return os;
        }

        inline std::mutex& log_mutex() {
            static std::mutex m;
            return m;
        }

        template <typename... Args>
        void emit_log(log_level level, const std::source_location& loc, Args&&... args) {
            if (level < log_threshold().load(std::memory_order_relaxed)) {
                return;
            }
            std::lock_guard lock{log_mutex()};
            auto& os = *log_stream().load(std::memory_order_acquire);
            os << to_string(level) << " [" << sloc_fname(loc) << ':' << loc.line() << "] ";
            (os << ... << std::forward<Args>(args)) << std::endl;
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::log_threshold().store(level, std::memory_order_relaxed);
    }

    inline log_level current_log_level() {
        return detail::log_threshold().load(std::memory_order_relaxed);
    }

    // Redirects all log output; pass nullptr to restore stderr
    inline void set_log_stream(std::ostream* os) {
        detail::log_stream().store(os ? os : &std::cerr, std::memory_order_release);
    }

// Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct log_debug {
        constexpr explicit log_debug(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };
#else
    template <typename... Args>
    struct log_debug {
        constexpr explicit log_debug(Args&&...) {}
    };
#endif

    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::warn, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::error, loc, std::forward<Args>(args)...);
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

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        constexpr double clamp_unit(double value) {
            return std::clamp(value, 0.0, 1.0);
        }

    }  // namespace utils

}  // namespace parley
