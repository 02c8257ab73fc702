#pragma once

#include "config.hpp"
#include "executor.hpp"
#include "state_manager.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

    // Rolling window of the last `capacity` samples of one metric.
    class metric_window {
      public:
        explicit metric_window(size_t capacity = 100U) : capacity_{capacity == 0U ? 1U : capacity} {}

        void push(double value);
        metric_stats stats() const;

        size_t size() const { return samples_.size(); }
        bool empty() const { return samples_.empty(); }

      private:
        size_t capacity_;
        std::deque<double> samples_{};
    };

    // Append-only audit record of one applied rule.
    struct adaptation_event {
        uint64_t id{};
        timestamp at{};
        // The condition that held, e.g. "session.overall_score mean lt 0.70 (0.62)".
        std::string trigger{};
        std::string rule{};
        // Deltas as applied, after clamping.
        param_map deltas{};
        std::string scope{global_session_id};
        bool clamped{false};
        // Revision of the global session that the change produced.
        uint64_t revision{};
    };

    // Rolling per-parameter totals of the events that left the log.
    struct parameter_stats {
        size_t adjustments{};
        size_t clamped{};
        double net_delta{};
        timestamp last_at{};
    };

    struct rule_error {
        std::string rule{};
        std::string message{};
        timestamp at{};
    };

    struct adaptation_status {
        param_map parameters{};
        metric_snapshot trends{};
        // Newest last, at most ten.
        std::vector<adaptation_event> recent_events{};
        size_t rule_count{};
        // Every event ever recorded, compacted ones included.
        uint64_t total_adaptations{};
        uint64_t cycles{};
        size_t completed_sessions{};
    };

    struct cycle_result {
        uint64_t cycle{};
        std::vector<adaptation_event> events{};
        std::vector<rule_error> errors{};
    };

    /*
     * Rule-based parameter tuning across sessions.
     *
     * Metrics are fed per completed session; a cycle evaluates the rules against the
     * window statistics and applies each fired rule to the global pseudo-session through
     * the state manager. Parameters never leave their configured bounds, including values
     * restored from an earlier process. With `event_log_file` set the event log is reloaded
     * at construction and rewritten whenever it grows.
     */
    class adaptation_engine {
      public:
        adaptation_engine(adaptation_config cfg, state_manager& state);

        adaptation_engine(const adaptation_engine&) = delete;
        adaptation_engine& operator=(const adaptation_engine&) = delete;

        void record_metric(std::string_view name, double value);

        // Feeds latency, confidence, failure and score metrics of one finished session and,
        // when auto_cycle is on, runs a cycle every `sessions_per_cycle` sessions.
        void record_session(const execution_summary& summary);

        cycle_result run_cycle(std::string_view trigger = "manual"sv);

        void add_rule(adaptation_rule rule);

        // Puts every parameter back to its configured value and forgets the metric windows.
        // Logged as a "reset" event.
        adaptation_event reset();

        // Rolls the global session back to the revision before `event_id` was applied, undoing
        // that event and every later one. Logged as a "revert" event.
        adaptation_event revert(uint64_t event_id);

        adaptation_status status() const;

        param_map current_parameters() const;
        metric_snapshot metrics() const;
        std::vector<adaptation_event> events() const;
        std::vector<rule_error> rule_errors() const;
        std::map<std::string, parameter_stats> parameter_history() const;

        size_t completed_sessions() const;
        uint64_t cycles() const;

        const adaptation_config& config() const { return cfg_; }

      private:
        metric_snapshot metrics_locked() const;
        void compact_locked();
        adaptation_event record_change_locked(
                std::string trigger, std::string rule, const param_map& before, uint64_t revision);
        void load_log();
        void save_log_locked() const;

        adaptation_config cfg_;
        state_manager& state_;

        mutable std::mutex mutex_;
        std::map<std::string, metric_window, std::less<>> windows_{};
        std::map<std::string, uint32_t, std::less<>> streaks_{};
        std::deque<adaptation_event> events_{};
        std::map<std::string, parameter_stats> compacted_{};
        std::deque<rule_error> errors_{};
        uint64_t next_event_id_{1U};
        uint64_t cycles_{};
        size_t completed_{};
    };

}  // namespace parley
