#include "parley/adaptation.hpp"

#include "internal/json_io.hpp"
#include "internal/types.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <numeric>
#include <set>

using namespace parley::literals;

namespace parley {
    namespace detail {

        // Least-squares slope of the samples against their index.
        static double slope_of(const std::deque<double>& samples) {
            auto n = static_cast<double>(samples.size());
            if (samples.size() < 2U) {
                return 0.0;
            }
            double sum_x{}, sum_y{}, sum_xy{}, sum_xx{};
            for (size_t i = 0U; i < samples.size(); ++i) {
                auto x = static_cast<double>(i);
                sum_x += x;
                sum_y += samples[i];
                sum_xy += x * samples[i];
                sum_xx += x * x;
            }
            auto denom = n * sum_xx - sum_x * sum_x;
            return denom == 0.0 ? 0.0 : (n * sum_xy - sum_x * sum_y) / denom;
        }

        static std::string describe_condition(const threshold_condition& c, double observed) {
            return "{} {} {} {:.2f} ({:.2f})"_format(c.metric, c.statistic, c.op, c.threshold, observed);
        }

        static bool is_clamped(double requested, double applied) { return std::abs(requested - applied) > 1e-12; }

    }  // namespace detail

    void metric_window::push(double value) {
        samples_.push_back(value);
        while (samples_.size() > capacity_) {
            samples_.pop_front();
        }
    }

    metric_stats metric_window::stats() const {
        metric_stats out{};
        if (samples_.empty()) {
            return out;
        }
        out.count = samples_.size();
        out.mean = std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(out.count);
        auto [lo, hi] = std::ranges::minmax_element(samples_);
        out.min = *lo;
        out.max = *hi;
        out.last = samples_.back();
        out.slope = detail::slope_of(samples_);

        std::vector<double> sorted{samples_.begin(), samples_.end()};
        std::ranges::sort(sorted);
        // nearest-rank
        auto rank = static_cast<size_t>(std::ceil(0.95 * static_cast<double>(sorted.size())));
        out.p95 = sorted[std::clamp<size_t>(rank, 1U, sorted.size()) - 1U];
        return out;
    }

    adaptation_engine::adaptation_engine(adaptation_config cfg, state_manager& state)
            : cfg_{std::move(cfg)}, state_{state} {
        graph_state global{};
        global.session_id = std::string{global_session_id};
        global.context.session_id = global.session_id;
        global.parameters = cfg_.parameters;
        global.bounds = cfg_.bounds;

        // Values tuned by an earlier process win over the configured starting point; the
        // configured bounds and parameter set win over the stored ones.
        const auto& store = state_.store();
        if (!state_.contains(global_session_id) && store && store->latest_revision(global_session_id)) {
            auto restored = state_.resume(global_session_id);
            auto revision =
                    state_.apply(global_session_id, mutation::configure_params{cfg_.parameters, cfg_.bounds});
            log_info(
                    "adaptation: restored global parameters at revision ",
                    restored.revision,
                    ", reconciled with the config at ",
                    revision);
        }
        else {
            auto revision = state_.ensure_session(std::move(global));
            log_debug("adaptation: global parameters at revision ", revision);
        }
        load_log();
    }

    void adaptation_engine::record_metric(std::string_view name, double value) {
        if (!std::isfinite(value)) {
            log_warn("adaptation: dropping non-finite sample for ", name);
            return;
        }
        std::lock_guard lock{mutex_};
        auto it = windows_.find(name);
        if (it == windows_.end()) {
            it = windows_.emplace(std::string{name}, metric_window{cfg_.window_size}).first;
        }
        it->second.push(value);
    }

    void adaptation_engine::record_session(const execution_summary& summary) {
        for (const auto& attempt : summary.attempts) {
            auto kind = modality_of(attempt.type);
            if (!kind) {
                continue;
            }
            auto prefix = to_string(*kind);
            record_metric("{}.latency_ms"_format(prefix), static_cast<double>(attempt.latency.count()));
            record_metric("{}.failure"_format(prefix), attempt.failure ? 1.0 : 0.0);
            if (attempt.confidence) {
                record_metric("{}.confidence"_format(prefix), *attempt.confidence);
            }
        }

        const auto& report = summary.report;
        double confidence_sum{};
        size_t confident{};
        for (const auto& [kind, m] : report.modalities) {
            if (m.score) {
                record_metric("{}.score"_format(kind), *m.score);
            }
            if (m.status == modality_status::ok && m.confidence) {
                confidence_sum += *m.confidence;
                ++confident;
            }
        }
        if (report.overall_score) {
            record_metric("session.overall_score", *report.overall_score);
        }
        if (confident > 0U) {
            record_metric("session.confidence", confidence_sum / static_cast<double>(confident));
        }
        record_metric("session.partial", report.partial ? 1.0 : 0.0);

        bool due = false;
        {
            std::lock_guard lock{mutex_};
            ++completed_;
            due = cfg_.auto_cycle && cfg_.sessions_per_cycle > 0U && completed_ % cfg_.sessions_per_cycle == 0U;
        }
        if (due) {
            run_cycle("auto"sv);
        }
    }

    cycle_result adaptation_engine::run_cycle(std::string_view trigger) {
        std::lock_guard lock{mutex_};
        cycle_result result{};
        result.cycle = ++cycles_;

        auto snapshot = metrics_locked();

        std::vector<const adaptation_rule*> ordered{};
        ordered.reserve(cfg_.rules.size());
        for (const auto& rule : cfg_.rules) {
            if (rule.enabled) {
                ordered.push_back(&rule);
            }
        }
        std::ranges::stable_sort(ordered, [](const adaptation_rule* lhs, const adaptation_rule* rhs) {
            return lhs->priority > rhs->priority;
        });

        auto record_error = [&](const adaptation_rule& rule, std::string message) {
            log_error("adaptation: rule '", rule.name, "' failed: ", message);
            rule_error err{rule.name, std::move(message), now_ms()};
            result.errors.push_back(err);
            errors_.push_back(std::move(err));
            while (errors_.size() > cfg_.event_log_capacity) {
                errors_.pop_front();
            }
        };

        std::set<std::string> claimed{};
        for (const auto* rule : ordered) {
            bool holds = false;
            std::string why{};
            try {
                if (rule->predicate) {
                    holds = rule->predicate(snapshot);
                    why = "predicate";
                }
                else {
                    const auto& c = rule->condition;
                    auto it = snapshot.find(c.metric);
                    if (it == snapshot.end()) {
                        throw error{"unknown metric '{}'"_format(c.metric)};
                    }
                    auto observed = it->second.get(c.statistic);
                    holds = compare(observed, c.op, c.threshold);
                    why = detail::describe_condition(c, observed);
                }
            } catch (const std::exception& e) {
                streaks_.erase(rule->name);
                record_error(*rule, e.what());
                continue;
            }

            auto& streak = streaks_[rule->name];
            streak = holds ? streak + 1U : 0U;
            auto needed = rule->predicate ? 1U : std::max(rule->condition.consecutive_windows, 1U);
            if (streak < needed) {
                continue;
            }
            streak = 0U;

            const auto& parameter = rule->action.parameter;
            if (claimed.contains(parameter)) {
                log_debug("adaptation: rule '", rule->name, "' yields ", parameter, " to a higher priority rule");
                continue;
            }
            claimed.insert(parameter);

            try {
                auto before = state_.snapshot(global_session_id);
                auto current = before.parameters.find(parameter);
                if (current == before.parameters.end()) {
                    throw error{"unknown parameter '{}'"_format(parameter)};
                }
                auto revision =
                        state_.apply(global_session_id, mutation::adjust_params{{{parameter, rule->action.delta}}});
                auto after = state_.snapshot(global_session_id).parameters.at(parameter);
                auto applied = after - current->second;

                adaptation_event event{
                        .id = next_event_id_++,
                        .at = now_ms(),
                        .trigger = "{}: {}"_format(trigger, why),
                        .rule = rule->name,
                        .deltas = {{parameter, applied}},
                        .scope = std::string{global_session_id},
                        .clamped = detail::is_clamped(rule->action.delta, applied),
                        .revision = revision};
                log_info(
                        "adaptation: '",
                        rule->name,
                        "' moved ",
                        parameter,
                        " ",
                        current->second,
                        " -> ",
                        after,
                        event.clamped ? " (clamped)" : "");
                result.events.push_back(event);
                events_.push_back(std::move(event));
            } catch (const std::exception& e) {
                record_error(*rule, e.what());
            }
        }

        compact_locked();
        if (!result.events.empty()) {
            save_log_locked();
        }
        return result;
    }

    void adaptation_engine::add_rule(adaptation_rule rule) {
        std::lock_guard lock{mutex_};
        if (rule.name.empty()) {
            throw invalid_configuration_error{"adaptation rule needs a name"};
        }
        auto dup = std::ranges::any_of(cfg_.rules, [&](const adaptation_rule& r) { return r.name == rule.name; });
        if (dup) {
            throw invalid_configuration_error{"duplicate adaptation rule '{}'"_format(rule.name)};
        }
        cfg_.rules.push_back(std::move(rule));
    }

    adaptation_event adaptation_engine::reset() {
        std::lock_guard lock{mutex_};
        auto before = state_.snapshot(global_session_id).parameters;
        auto revision = state_.apply(
                global_session_id, mutation::configure_params{cfg_.parameters, cfg_.bounds, /*reset=*/true});
        windows_.clear();
        streaks_.clear();
        log_warn("adaptation: parameters reset to their configured values");
        return record_change_locked("reset", "reset", before, revision);
    }

    adaptation_event adaptation_engine::revert(uint64_t event_id) {
        std::lock_guard lock{mutex_};
        auto it = std::ranges::find(events_, event_id, &adaptation_event::id);
        if (it == events_.end()) {
            throw error{"adaptation event {} is not in the log"_format(event_id)};
        }
        if (it->revision == 0U) {
            throw error{"adaptation event {} has no revision to revert"_format(event_id)};
        }
        auto target = it->revision - 1U;

        auto before = state_.snapshot(global_session_id).parameters;
        state_.rollback(global_session_id, target);
        streaks_.clear();
        log_warn("adaptation: reverted event ", event_id, ", global parameters back at revision ", target);
        return record_change_locked("revert of event {}"_format(event_id), "revert", before, target);
    }

    adaptation_event adaptation_engine::record_change_locked(
            std::string trigger, std::string rule, const param_map& before, uint64_t revision) {
        auto after = state_.snapshot(global_session_id).parameters;
        param_map deltas{};
        for (const auto& [parameter, value] : after) {
            auto prior = before.find(parameter);
            auto delta = prior == before.end() ? value : value - prior->second;
            if (delta != 0.0) {
                deltas.emplace(parameter, delta);
            }
        }

        adaptation_event event{
                .id = next_event_id_++,
                .at = now_ms(),
                .trigger = std::move(trigger),
                .rule = std::move(rule),
                .deltas = std::move(deltas),
                .scope = std::string{global_session_id},
                .clamped = false,
                .revision = revision};
        events_.push_back(event);
        compact_locked();
        save_log_locked();
        return event;
    }

    adaptation_status adaptation_engine::status() const {
        auto parameters = current_parameters();
        std::lock_guard lock{mutex_};
        adaptation_status out{};
        out.parameters = std::move(parameters);
        out.trends = metrics_locked();
        auto recent = std::min<size_t>(events_.size(), 10U);
        out.recent_events.assign(events_.end() - static_cast<std::ptrdiff_t>(recent), events_.end());
        out.rule_count = cfg_.rules.size();
        out.total_adaptations = next_event_id_ - 1U;
        out.cycles = cycles_;
        out.completed_sessions = completed_;
        return out;
    }

    param_map adaptation_engine::current_parameters() const {
        return state_.snapshot(global_session_id).parameters;
    }

    metric_snapshot adaptation_engine::metrics() const {
        std::lock_guard lock{mutex_};
        return metrics_locked();
    }

    metric_snapshot adaptation_engine::metrics_locked() const {
        metric_snapshot out{};
        for (const auto& [name, window] : windows_) {
            if (!window.empty()) {
                out.emplace(name, window.stats());
            }
        }
        return out;
    }

    std::vector<adaptation_event> adaptation_engine::events() const {
        std::lock_guard lock{mutex_};
        return {events_.begin(), events_.end()};
    }

    std::vector<rule_error> adaptation_engine::rule_errors() const {
        std::lock_guard lock{mutex_};
        return {errors_.begin(), errors_.end()};
    }

    std::map<std::string, parameter_stats> adaptation_engine::parameter_history() const {
        std::lock_guard lock{mutex_};
        auto out = compacted_;
        for (const auto& event : events_) {
            for (const auto& [parameter, delta] : event.deltas) {
                auto& stats = out[parameter];
                ++stats.adjustments;
                stats.clamped += event.clamped ? 1U : 0U;
                stats.net_delta += delta;
                stats.last_at = std::max(stats.last_at, event.at);
            }
        }
        return out;
    }

    size_t adaptation_engine::completed_sessions() const {
        std::lock_guard lock{mutex_};
        return completed_;
    }

    uint64_t adaptation_engine::cycles() const {
        std::lock_guard lock{mutex_};
        return cycles_;
    }

    void adaptation_engine::compact_locked() {
        while (events_.size() > cfg_.event_log_capacity) {
            const auto& oldest = events_.front();
            for (const auto& [parameter, delta] : oldest.deltas) {
                auto& stats = compacted_[parameter];
                ++stats.adjustments;
                stats.clamped += oldest.clamped ? 1U : 0U;
                stats.net_delta += delta;
                stats.last_at = std::max(stats.last_at, oldest.at);
            }
            events_.pop_front();
        }
    }

    void adaptation_engine::load_log() {
        if (!cfg_.event_log_file || !std::filesystem::exists(*cfg_.event_log_file)) {
            return;
        }
        const auto& path = *cfg_.event_log_file;
        auto data = internal::read_json_file<internal::persisted_adaptation_log>(path);
        internal::validate_supported_schema_version(data.schema_version, path.string());

        std::lock_guard lock{mutex_};
        for (auto& e : data.events) {
            events_.push_back(adaptation_event{
                    .id = e.id,
                    .at = timestamp{std::chrono::milliseconds{e.at_ms}},
                    .trigger = std::move(e.trigger),
                    .rule = std::move(e.rule),
                    .deltas = std::move(e.deltas),
                    .scope = std::move(e.scope),
                    .clamped = e.clamped,
                    .revision = e.revision});
        }
        for (const auto& [parameter, stats] : data.compacted) {
            compacted_[parameter] = parameter_stats{
                    .adjustments = static_cast<size_t>(stats.adjustments),
                    .clamped = static_cast<size_t>(stats.clamped),
                    .net_delta = stats.net_delta,
                    .last_at = timestamp{std::chrono::milliseconds{stats.last_at_ms}}};
        }
        next_event_id_ = std::max<uint64_t>(data.next_event_id, events_.empty() ? 1U : events_.back().id + 1U);
        cycles_ = data.cycles;
        compact_locked();
        log_info("adaptation: loaded ", events_.size(), " events from ", path.string());
    }

    void adaptation_engine::save_log_locked() const {
        if (!cfg_.event_log_file) {
            return;
        }
        internal::persisted_adaptation_log data{};
        data.next_event_id = next_event_id_;
        data.cycles = cycles_;
        for (const auto& e : events_) {
            data.events.push_back(internal::persisted_adaptation_event{
                    .id = e.id,
                    .at_ms = e.at.time_since_epoch().count(),
                    .trigger = e.trigger,
                    .rule = e.rule,
                    .deltas = e.deltas,
                    .scope = e.scope,
                    .clamped = e.clamped,
                    .revision = e.revision});
        }
        for (const auto& [parameter, stats] : compacted_) {
            data.compacted.emplace(
                    parameter,
                    internal::persisted_parameter_stats{
                            .adjustments = stats.adjustments,
                            .clamped = stats.clamped,
                            .net_delta = stats.net_delta,
                            .last_at_ms = stats.last_at.time_since_epoch().count()});
        }

        try {
            auto parent = cfg_.event_log_file->parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            internal::write_json_file(data, *cfg_.event_log_file);
        } catch (const std::exception& e) {
            // the in-memory log stands; the next change rewrites the whole file
            log_error("adaptation: failed to save the event log: ", e.what());
        }
    }

}  // namespace parley
