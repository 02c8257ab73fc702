#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace parley::internal {

    inline constexpr int supported_schema_version = 1;

    struct persisted_bounds {
        double min{};
        double max{};
    };

    struct persisted_executor {
        uint32_t workers{4U};
        int64_t task_timeout_ms{30'000};
        uint32_t max_attempts{3U};
        int64_t backoff_base_ms{1'000};
        int64_t backoff_cap_ms{30'000};
    };

    struct persisted_state {
        uint32_t history_depth{50U};
        uint64_t persist_every_revisions{10U};
        int64_t persist_interval_ms{5'000};
    };

    struct persisted_planner {
        std::string content_priority{"high"};
        std::string speech_priority{"normal"};
        std::string visual_priority{"normal"};
        std::string integration_priority{"critical"};
        std::string feedback_priority{"critical"};
    };

    struct persisted_rule {
        std::string name{};
        int priority{1};
        bool enabled{true};
        std::string metric{};
        std::string statistic{"mean"};
        std::string comparison{"lt"};
        double threshold{};
        uint32_t consecutive_windows{1U};
        std::string parameter{};
        double delta{};
    };

    struct persisted_adaptation {
        uint32_t window_size{100U};
        uint32_t sessions_per_cycle{10U};
        uint32_t event_log_capacity{1'000U};
        bool auto_cycle{true};
        std::map<std::string, double> parameters{};
        std::map<std::string, persisted_bounds> bounds{};
        std::vector<persisted_rule> rules{};
    };

    struct persisted_engine_config {
        int schema_version{supported_schema_version};
        persisted_executor executor{};
        persisted_state state{};
        persisted_planner planner{};
        persisted_adaptation adaptation{};
    };

    struct persisted_input {
        std::string ref{};
        std::string text{};
        std::map<std::string, double> features{};
    };

    struct persisted_task {
        uint64_t id{};
        std::string type{};
        std::string priority{};
        std::string status{};
        std::string input_ref{};
        std::map<std::string, double> input_params{};
        bool best_effort{false};
        uint64_t sequence{};
        int64_t created_at_ms{};
        std::optional<int64_t> started_at_ms{};
        std::optional<int64_t> finished_at_ms{};
        std::optional<int64_t> eligible_at_ms{};
        uint32_t attempt_count{};
        uint32_t max_attempts{3U};
        std::optional<std::string> last_error{};
        std::vector<uint64_t> dependencies{};
    };

    struct persisted_result {
        uint64_t task_id{};
        std::string modality{};
        std::map<std::string, double> scores{};
        std::string raw_features{};
        double confidence{};
        int64_t produced_at_ms{};
    };

    struct persisted_graph_state {
        int schema_version{supported_schema_version};
        std::string session_id{};
        uint64_t revision{};
        std::string job_position{};
        std::string mode{"quick"};
        std::map<std::string, double> focus_weights{};
        std::optional<persisted_input> transcript{};
        std::optional<persisted_input> audio{};
        std::optional<persisted_input> video{};
        uint64_t next_sequence{1U};
        std::vector<persisted_task> tasks{};
        std::vector<persisted_result> results{};
        std::map<std::string, double> parameters{};
        std::map<std::string, persisted_bounds> bounds{};
    };

    struct persisted_adaptation_event {
        uint64_t id{};
        int64_t at_ms{};
        std::string trigger{};
        std::string rule{};
        std::map<std::string, double> deltas{};
        std::string scope{};
        bool clamped{false};
        uint64_t revision{};
    };

    struct persisted_parameter_stats {
        uint64_t adjustments{};
        uint64_t clamped{};
        double net_delta{};
        int64_t last_at_ms{};
    };

    // <cache_dir>/adaptation_events.json
    struct persisted_adaptation_log {
        int schema_version{supported_schema_version};
        uint64_t next_event_id{1U};
        uint64_t cycles{};
        std::vector<persisted_adaptation_event> events{};
        std::map<std::string, persisted_parameter_stats> compacted{};
    };

    // Command line input for one session.
    struct persisted_submission {
        std::string session_id{};
        std::string job_position{};
        std::string mode{"quick"};
        std::map<std::string, double> focus_weights{};
        std::optional<persisted_input> transcript{};
        std::optional<persisted_input> audio{};
        std::optional<persisted_input> video{};
    };

    struct persisted_modality_summary {
        std::string status{};
        std::optional<double> score{};
        std::optional<double> confidence{};
        std::optional<std::string> error{};
    };

    struct report_output_record {
        std::string session_id{};
        std::string outcome{};
        bool partial{false};
        std::optional<double> overall_score{};
        std::map<std::string, persisted_modality_summary> modalities{};
        std::vector<std::string> strengths{};
        std::vector<std::string> weaknesses{};
        std::vector<std::string> suggestions{};
    };

}  // namespace parley::internal

namespace glz {

    template <>
    struct meta<parley::internal::persisted_bounds> {
        using T = parley::internal::persisted_bounds;
        static constexpr auto value = object("min", &T::min, "max", &T::max);
    };

    template <>
    struct meta<parley::internal::persisted_executor> {
        using T = parley::internal::persisted_executor;
        static constexpr auto value =
                object("workers",
                       &T::workers,
                       "task_timeout_ms",
                       &T::task_timeout_ms,
                       "max_attempts",
                       &T::max_attempts,
                       "backoff_base_ms",
                       &T::backoff_base_ms,
                       "backoff_cap_ms",
                       &T::backoff_cap_ms);
    };

    template <>
    struct meta<parley::internal::persisted_state> {
        using T = parley::internal::persisted_state;
        static constexpr auto value =
                object("history_depth",
                       &T::history_depth,
                       "persist_every_revisions",
                       &T::persist_every_revisions,
                       "persist_interval_ms",
                       &T::persist_interval_ms);
    };

    template <>
    struct meta<parley::internal::persisted_planner> {
        using T = parley::internal::persisted_planner;
        static constexpr auto value =
                object("content_priority",
                       &T::content_priority,
                       "speech_priority",
                       &T::speech_priority,
                       "visual_priority",
                       &T::visual_priority,
                       "integration_priority",
                       &T::integration_priority,
                       "feedback_priority",
                       &T::feedback_priority);
    };

    template <>
    struct meta<parley::internal::persisted_rule> {
        using T = parley::internal::persisted_rule;
        static constexpr auto value =
                object("name",
                       &T::name,
                       "priority",
                       &T::priority,
                       "enabled",
                       &T::enabled,
                       "metric",
                       &T::metric,
                       "statistic",
                       &T::statistic,
                       "comparison",
                       &T::comparison,
                       "threshold",
                       &T::threshold,
                       "consecutive_windows",
                       &T::consecutive_windows,
                       "parameter",
                       &T::parameter,
                       "delta",
                       &T::delta);
    };

    template <>
    struct meta<parley::internal::persisted_adaptation> {
        using T = parley::internal::persisted_adaptation;
        static constexpr auto value =
                object("window_size",
                       &T::window_size,
                       "sessions_per_cycle",
                       &T::sessions_per_cycle,
                       "event_log_capacity",
                       &T::event_log_capacity,
                       "auto_cycle",
                       &T::auto_cycle,
                       "parameters",
                       &T::parameters,
                       "bounds",
                       &T::bounds,
                       "rules",
                       &T::rules);
    };

    template <>
    struct meta<parley::internal::persisted_engine_config> {
        using T = parley::internal::persisted_engine_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "executor",
                       &T::executor,
                       "state",
                       &T::state,
                       "planner",
                       &T::planner,
                       "adaptation",
                       &T::adaptation);
    };

    template <>
    struct meta<parley::internal::persisted_input> {
        using T = parley::internal::persisted_input;
        static constexpr auto value = object("ref", &T::ref, "text", &T::text, "features", &T::features);
    };

    template <>
    struct meta<parley::internal::persisted_task> {
        using T = parley::internal::persisted_task;
        static constexpr auto value =
                object("id",
                       &T::id,
                       "type",
                       &T::type,
                       "priority",
                       &T::priority,
                       "status",
                       &T::status,
                       "input_ref",
                       &T::input_ref,
                       "input_params",
                       &T::input_params,
                       "best_effort",
                       &T::best_effort,
                       "sequence",
                       &T::sequence,
                       "created_at_ms",
                       &T::created_at_ms,
                       "started_at_ms",
                       &T::started_at_ms,
                       "finished_at_ms",
                       &T::finished_at_ms,
                       "eligible_at_ms",
                       &T::eligible_at_ms,
                       "attempt_count",
                       &T::attempt_count,
                       "max_attempts",
                       &T::max_attempts,
                       "last_error",
                       &T::last_error,
                       "dependencies",
                       &T::dependencies);
    };

    template <>
    struct meta<parley::internal::persisted_result> {
        using T = parley::internal::persisted_result;
        static constexpr auto value =
                object("task_id",
                       &T::task_id,
                       "modality",
                       &T::modality,
                       "scores",
                       &T::scores,
                       "raw_features",
                       &T::raw_features,
                       "confidence",
                       &T::confidence,
                       "produced_at_ms",
                       &T::produced_at_ms);
    };

    template <>
    struct meta<parley::internal::persisted_graph_state> {
        using T = parley::internal::persisted_graph_state;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "session_id",
                       &T::session_id,
                       "revision",
                       &T::revision,
                       "job_position",
                       &T::job_position,
                       "mode",
                       &T::mode,
                       "focus_weights",
                       &T::focus_weights,
                       "transcript",
                       &T::transcript,
                       "audio",
                       &T::audio,
                       "video",
                       &T::video,
                       "next_sequence",
                       &T::next_sequence,
                       "tasks",
                       &T::tasks,
                       "results",
                       &T::results,
                       "parameters",
                       &T::parameters,
                       "bounds",
                       &T::bounds);
    };

    template <>
    struct meta<parley::internal::persisted_adaptation_event> {
        using T = parley::internal::persisted_adaptation_event;
        static constexpr auto value =
                object("id",
                       &T::id,
                       "at_ms",
                       &T::at_ms,
                       "trigger",
                       &T::trigger,
                       "rule",
                       &T::rule,
                       "deltas",
                       &T::deltas,
                       "scope",
                       &T::scope,
                       "clamped",
                       &T::clamped,
                       "revision",
                       &T::revision);
    };

    template <>
    struct meta<parley::internal::persisted_parameter_stats> {
        using T = parley::internal::persisted_parameter_stats;
        static constexpr auto value =
                object("adjustments",
                       &T::adjustments,
                       "clamped",
                       &T::clamped,
                       "net_delta",
                       &T::net_delta,
                       "last_at_ms",
                       &T::last_at_ms);
    };

    template <>
    struct meta<parley::internal::persisted_adaptation_log> {
        using T = parley::internal::persisted_adaptation_log;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "next_event_id",
                       &T::next_event_id,
                       "cycles",
                       &T::cycles,
                       "events",
                       &T::events,
                       "compacted",
                       &T::compacted);
    };

    template <>
    struct meta<parley::internal::persisted_submission> {
        using T = parley::internal::persisted_submission;
        static constexpr auto value =
                object("session_id",
                       &T::session_id,
                       "job_position",
                       &T::job_position,
                       "mode",
                       &T::mode,
                       "focus_weights",
                       &T::focus_weights,
                       "transcript",
                       &T::transcript,
                       "audio",
                       &T::audio,
                       "video",
                       &T::video);
    };

    template <>
    struct meta<parley::internal::persisted_modality_summary> {
        using T = parley::internal::persisted_modality_summary;
        static constexpr auto value =
                object("status", &T::status, "score", &T::score, "confidence", &T::confidence, "error", &T::error);
    };

    template <>
    struct meta<parley::internal::report_output_record> {
        using T = parley::internal::report_output_record;
        static constexpr auto value =
                object("session_id",
                       &T::session_id,
                       "outcome",
                       &T::outcome,
                       "partial",
                       &T::partial,
                       "overall_score",
                       &T::overall_score,
                       "modalities",
                       &T::modalities,
                       "strengths",
                       &T::strengths,
                       "weaknesses",
                       &T::weaknesses,
                       "suggestions",
                       &T::suggestions);
    };

}  // namespace glz
