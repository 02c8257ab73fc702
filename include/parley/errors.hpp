#pragma once

#include "utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace parley {

    class error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Planner output or a task batch would introduce a dependency cycle; nothing was inserted.
    class cyclic_dependency_error : public error {
      public:
        using error::error;
    };

    class invalid_configuration_error : public error {
      public:
        using error::error;
    };

    class invalid_transition_error : public error {
      public:
        using error::error;
    };

    class unknown_session_error : public error {
      public:
        explicit unknown_session_error(std::string_view session_id)
                : error{"unknown session: " + std::string{session_id}}, session_id_{session_id} {}

        const std::string& session_id() const noexcept { return session_id_; }

      private:
        std::string session_id_;
    };

    // Caller must re-read the session state and retry its mutation.
    class stale_revision_conflict : public error {
      public:
        stale_revision_conflict(std::string what, uint64_t expected, uint64_t actual)
                : error{std::move(what)}, expected_{expected}, actual_{actual} {}

        uint64_t expected_revision() const noexcept { return expected_; }
        uint64_t actual_revision() const noexcept { return actual_; }

      private:
        uint64_t expected_{};
        uint64_t actual_{};
    };

    enum class analyzer_errc : uint8_t {
        input_unavailable,
        transient_provider_error,
        deadline_exceeded,
        invalid_params,
        cancelled,
    };

    inline constexpr std::string_view to_string(analyzer_errc code) {
        switch (code) {
            case analyzer_errc::input_unavailable:
                return "input_unavailable"sv;
            case analyzer_errc::transient_provider_error:
                return "transient_provider_error"sv;
            case analyzer_errc::deadline_exceeded:
                return "deadline_exceeded"sv;
            case analyzer_errc::invalid_params:
                return "invalid_params"sv;
            case analyzer_errc::cancelled:
                return "cancelled"sv;
        }
        return "transient_provider_error"sv;
    }

    struct analyzer_error {
        analyzer_errc code{analyzer_errc::transient_provider_error};
        std::string message{};

        bool retryable() const noexcept {
            return code == analyzer_errc::transient_provider_error || code == analyzer_errc::deadline_exceeded;
        }

        std::string describe() const {
            if (message.empty()) {
                return std::string{to_string(code)};
            }
            return std::string{to_string(code)} + ": " + message;
        }
    };

}  // namespace parley
