#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace parley {

    using task_id = uint64_t;
    using param_map = std::map<std::string, double>;

    // Millisecond wall-clock timestamps; coarse enough to round-trip through snapshots exactly.
    using timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

    inline timestamp now_ms() {
        return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    enum class task_type : uint8_t {
        speech_analysis,
        visual_analysis,
        content_analysis,
        integration,
        feedback,
    };

    enum class task_priority : uint8_t { low, normal, high, critical };

    enum class task_status : uint8_t {
        pending,
        running,
        succeeded,
        failed,
        skipped,
        cancelled,
    };

    enum class modality : uint8_t { speech, visual, content };

    inline constexpr std::string_view to_string(task_type type) {
        switch (type) {
            case task_type::speech_analysis:
                return "speech_analysis"sv;
            case task_type::visual_analysis:
                return "visual_analysis"sv;
            case task_type::content_analysis:
                return "content_analysis"sv;
            case task_type::integration:
                return "integration"sv;
            case task_type::feedback:
                return "feedback"sv;
        }
        return "integration"sv;
    }

    inline constexpr std::string_view to_string(task_priority priority) {
        switch (priority) {
            case task_priority::low:
                return "low"sv;
            case task_priority::normal:
                return "normal"sv;
            case task_priority::high:
                return "high"sv;
            case task_priority::critical:
                return "critical"sv;
        }
        return "normal"sv;
    }

    inline constexpr std::string_view to_string(task_status status) {
        switch (status) {
            case task_status::pending:
                return "pending"sv;
            case task_status::running:
                return "running"sv;
            case task_status::succeeded:
                return "succeeded"sv;
            case task_status::failed:
                return "failed"sv;
            case task_status::skipped:
                return "skipped"sv;
            case task_status::cancelled:
                return "cancelled"sv;
        }
        return "pending"sv;
    }

    inline constexpr std::string_view to_string(modality m) {
        switch (m) {
            case modality::speech:
                return "speech"sv;
            case modality::visual:
                return "visual"sv;
            case modality::content:
                return "content"sv;
        }
        return "content"sv;
    }

    inline constexpr bool try_parse_task_priority(std::string_view text, task_priority& out) {
        if (utils::str_case_eq(text, "low"sv)) {
            out = task_priority::low;
            return true;
        }
        if (utils::str_case_eq(text, "normal"sv)) {
            out = task_priority::normal;
            return true;
        }
        if (utils::str_case_eq(text, "high"sv)) {
            out = task_priority::high;
            return true;
        }
        if (utils::str_case_eq(text, "critical"sv)) {
            out = task_priority::critical;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_task_type(std::string_view text, task_type& out) {
        for (auto candidate :
             {task_type::speech_analysis,
              task_type::visual_analysis,
              task_type::content_analysis,
              task_type::integration,
              task_type::feedback}) {
            if (utils::str_case_eq(text, to_string(candidate))) {
                out = candidate;
                return true;
            }
        }
        return false;
    }

    inline constexpr bool try_parse_task_status(std::string_view text, task_status& out) {
        for (auto candidate :
             {task_status::pending,
              task_status::running,
              task_status::succeeded,
              task_status::failed,
              task_status::skipped,
              task_status::cancelled}) {
            if (utils::str_case_eq(text, to_string(candidate))) {
                out = candidate;
                return true;
            }
        }
        return false;
    }

    inline constexpr bool try_parse_modality(std::string_view text, modality& out) {
        if (utils::str_case_eq(text, "speech"sv)) {
            out = modality::speech;
            return true;
        }
        if (utils::str_case_eq(text, "visual"sv)) {
            out = modality::visual;
            return true;
        }
        if (utils::str_case_eq(text, "content"sv)) {
            out = modality::content;
            return true;
        }
        return false;
    }

    inline constexpr std::optional<modality> modality_of(task_type type) {
        switch (type) {
            case task_type::speech_analysis:
                return modality::speech;
            case task_type::visual_analysis:
                return modality::visual;
            case task_type::content_analysis:
                return modality::content;
            case task_type::integration:
            case task_type::feedback:
                return std::nullopt;
        }
        return std::nullopt;
    }

    inline constexpr task_type task_type_for(modality m) {
        switch (m) {
            case modality::speech:
                return task_type::speech_analysis;
            case modality::visual:
                return task_type::visual_analysis;
            case modality::content:
                return task_type::content_analysis;
        }
        return task_type::content_analysis;
    }

    inline constexpr bool is_modality_task(task_type type) {
        return modality_of(type).has_value();
    }

    struct task {
        task_id id{};
        task_type type{task_type::content_analysis};
        task_priority priority{task_priority::normal};
        task_status status{task_status::pending};
        std::string input_ref{};
        param_map input_params{};
        // Runs once every dependency is terminal, whether or not it succeeded.
        bool best_effort{false};
        // Insertion order within the owning graph; FIFO tie-break for equal priorities.
        uint64_t sequence{};
        timestamp created_at{};
        std::optional<timestamp> started_at{};
        std::optional<timestamp> finished_at{};
        std::optional<timestamp> eligible_at{};
        uint32_t attempt_count{};
        uint32_t max_attempts{3U};
        std::optional<std::string> last_error{};

        bool operator==(const task&) const = default;

        bool attempts_remaining() const noexcept { return attempt_count < max_attempts; }

        bool is_terminal() const noexcept {
            switch (status) {
                case task_status::succeeded:
                case task_status::skipped:
                case task_status::cancelled:
                    return true;
                case task_status::failed:
                    return !attempts_remaining();
                case task_status::pending:
                case task_status::running:
                    return false;
            }
            return false;
        }
    };

    /*
     * Legal task edges:
     *   pending -> running | skipped | cancelled
     *   running -> succeeded | failed | skipped | cancelled
     *   failed  -> pending            (only while attempts remain; checked by task_graph)
     */
    inline constexpr bool is_legal_transition(task_status from, task_status to) {
        switch (from) {
            case task_status::pending:
                return to == task_status::running || to == task_status::skipped || to == task_status::cancelled;
            case task_status::running:
                return to == task_status::succeeded || to == task_status::failed || to == task_status::skipped ||
                       to == task_status::cancelled;
            case task_status::failed:
                return to == task_status::pending;
            case task_status::succeeded:
            case task_status::skipped:
            case task_status::cancelled:
                return false;
        }
        return false;
    }

}  // namespace parley
