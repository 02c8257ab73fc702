#pragma once

#include "graph_state.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

    using namespace std::string_view_literals;

    /*
     * Parley Engine Config Options
     *
     * Executor
     * - workers: Bounded worker pool size per session (W).
     * - task_timeout: Hard deadline for one analyzer call (T_task).
     * - max_attempts: Attempts per task, first run included.
     * - backoff_base/backoff_cap: Retry delay is min(base * 2^attempts, cap).
     *
     * State
     * - history_depth: Revisions kept in memory for snapshot()/rollback() (N).
     * - persist_every_revisions: Snapshot cadence by revision count (K).
     * - persist_interval: Snapshot cadence by wall time (M); whichever comes first.
     *
     * Planner
     * - <stage>_priority: Priority assigned to each created task type.
     *
     * Adaptation
     * - window_size: Samples retained per metric.
     * - sessions_per_cycle: Completed sessions between automatic cycles.
     * - event_log_capacity: Adaptation events kept before compaction.
     * - auto_cycle: Run cycles automatically after sessions_per_cycle.
     * - parameters: Initial global parameters (frozen into tasks by the planner).
     * - bounds: Per-parameter [min, max] clamp.
     * - rules: Threshold rules; see adaptation_rule.
     */

    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    enum class metric_statistic : uint8_t { mean, p95, min, max, last, slope };

    inline constexpr std::string_view to_string(metric_statistic statistic) {
        switch (statistic) {
            case metric_statistic::mean:
                return "mean"sv;
            case metric_statistic::p95:
                return "p95"sv;
            case metric_statistic::min:
                return "min"sv;
            case metric_statistic::max:
                return "max"sv;
            case metric_statistic::last:
                return "last"sv;
            case metric_statistic::slope:
                return "slope"sv;
        }
        return "mean"sv;
    }

    inline constexpr bool try_parse_metric_statistic(std::string_view text, metric_statistic& out) {
        for (auto candidate :
             {metric_statistic::mean,
              metric_statistic::p95,
              metric_statistic::min,
              metric_statistic::max,
              metric_statistic::last,
              metric_statistic::slope}) {
            if (utils::str_case_eq(text, to_string(candidate))) {
                out = candidate;
                return true;
            }
        }
        return false;
    }

    enum class comparison : uint8_t { less_than, less_equal, greater_than, greater_equal };

    inline constexpr std::string_view to_string(comparison op) {
        switch (op) {
            case comparison::less_than:
                return "lt"sv;
            case comparison::less_equal:
                return "le"sv;
            case comparison::greater_than:
                return "gt"sv;
            case comparison::greater_equal:
                return "ge"sv;
        }
        return "lt"sv;
    }

    inline constexpr bool try_parse_comparison(std::string_view text, comparison& out) {
        if (utils::str_case_eq(text, "lt"sv) || text == "<"sv) {
            out = comparison::less_than;
            return true;
        }
        if (utils::str_case_eq(text, "le"sv) || text == "<="sv) {
            out = comparison::less_equal;
            return true;
        }
        if (utils::str_case_eq(text, "gt"sv) || text == ">"sv) {
            out = comparison::greater_than;
            return true;
        }
        if (utils::str_case_eq(text, "ge"sv) || text == ">="sv) {
            out = comparison::greater_equal;
            return true;
        }
        return false;
    }

    inline constexpr bool compare(double lhs, comparison op, double rhs) {
        switch (op) {
            case comparison::less_than:
                return lhs < rhs;
            case comparison::less_equal:
                return lhs <= rhs;
            case comparison::greater_than:
                return lhs > rhs;
            case comparison::greater_equal:
                return lhs >= rhs;
        }
        return false;
    }

    struct metric_stats {
        size_t count{};
        double mean{};
        double p95{};
        double min{};
        double max{};
        double last{};
        double slope{};

        bool operator==(const metric_stats&) const = default;

        double get(metric_statistic statistic) const {
            switch (statistic) {
                case metric_statistic::mean:
                    return mean;
                case metric_statistic::p95:
                    return p95;
                case metric_statistic::min:
                    return min;
                case metric_statistic::max:
                    return max;
                case metric_statistic::last:
                    return last;
                case metric_statistic::slope:
                    return slope;
            }
            return mean;
        }
    };

    using metric_snapshot = std::map<std::string, metric_stats>;

    struct threshold_condition {
        std::string metric{};
        metric_statistic statistic{metric_statistic::mean};
        comparison op{comparison::less_than};
        double threshold{};
        // Cycles in a row the condition must hold before the rule fires.
        uint32_t consecutive_windows{1U};
    };

    struct rule_action {
        std::string parameter{};
        double delta{};
    };

    /*
     * Rules are evaluated by descending priority (stable for ties). The first rule that
     * fires for a parameter wins that parameter for the cycle. A custom predicate, when set,
     * replaces the threshold test; it may throw, which is logged and recorded as a non-fatal
     * rule error.
     */
    struct adaptation_rule {
        std::string name{};
        int priority{1};
        bool enabled{true};
        threshold_condition condition{};
        rule_action action{};
        std::function<bool(const metric_snapshot&)> predicate{};
    };

    struct executor_config {
        size_t workers{4U};
        std::chrono::milliseconds task_timeout{30'000};
        uint32_t max_attempts{3U};
        std::chrono::milliseconds backoff_base{1'000};
        std::chrono::milliseconds backoff_cap{30'000};

        std::chrono::milliseconds backoff_for(uint32_t attempt_count) const {
            auto delay = backoff_base;
            for (uint32_t i = 0U; i < attempt_count && delay < backoff_cap; ++i) {
                delay *= 2;
            }
            return std::min(delay, backoff_cap);
        }
    };

    struct state_manager_config {
        size_t history_depth{50U};
        uint64_t persist_every_revisions{10U};
        std::chrono::milliseconds persist_interval{5'000};
    };

    struct planner_config {
        task_priority content_priority{task_priority::high};
        task_priority speech_priority{task_priority::normal};
        task_priority visual_priority{task_priority::normal};
        task_priority integration_priority{task_priority::critical};
        task_priority feedback_priority{task_priority::critical};

        task_priority priority_for(task_type type) const {
            switch (type) {
                case task_type::content_analysis:
                    return content_priority;
                case task_type::speech_analysis:
                    return speech_priority;
                case task_type::visual_analysis:
                    return visual_priority;
                case task_type::integration:
                    return integration_priority;
                case task_type::feedback:
                    return feedback_priority;
            }
            return task_priority::normal;
        }
    };

    struct adaptation_config {
        size_t window_size{100U};
        size_t sessions_per_cycle{10U};
        size_t event_log_capacity{1'000U};
        bool auto_cycle{true};
        param_map parameters{};
        std::map<std::string, parameter_bounds> bounds{};
        std::vector<adaptation_rule> rules{};
        // Where the event log is kept between runs; set by the front end, not read from JSON.
        std::optional<std::filesystem::path> event_log_file{};
    };

    struct engine_config {
        executor_config executor{};
        state_manager_config state{};
        planner_config planner{};
        adaptation_config adaptation{};
    };

    param_map default_parameters();
    std::map<std::string, parameter_bounds> default_parameter_bounds();
    std::vector<adaptation_rule> default_adaptation_rules();
    engine_config default_engine_config();

    // Throws invalid_configuration_error naming the first offending field.
    void validate_engine_config(const engine_config& cfg);

    engine_config parse_engine_config(std::string_view json, std::string_view origin = "<memory>"sv);
    engine_config load_engine_config(const std::filesystem::path& path);
    std::string engine_config_to_json(const engine_config& cfg);

    /*
     * Parley Startup Config Options (command line front end)
     *
     * - submission: JSON file with the user context and inputs of one session.
     * - config_file: Engine config JSON; defaults apply when absent.
     * - cache_dir: Root directory for session snapshots.
     * - resume_session: Session id (or "latest") to resume instead of starting fresh.
     * - output: Report shape ("table" or "json").
     * - workers/timeout_ms: Overrides for the executor section of the engine config.
     * - quiet/verbose: Coarse output verbosity knobs for app logs.
     * - print_config: Print resolved config and exit.
     * - dump_defaults: Print the compiled-in engine config as JSON and exit.
     */
    struct startup_config {
        std::optional<std::filesystem::path> submission{};
        std::optional<std::filesystem::path> config_file{};
        std::filesystem::path cache_dir{".parley"};
        std::optional<std::string> resume_session{};
        output_mode output{output_mode::table};
        std::optional<unsigned> workers{};
        std::optional<int> timeout_ms{};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
        bool dump_defaults{false};
    };

}  // namespace parley
