#include "parley/config.hpp"

#include "internal/json_io.hpp"
#include "internal/types.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <cmath>
#include <set>

using namespace parley::literals;

namespace parley {
    namespace detail {

        using namespace parley::internal;

        static task_priority parse_priority_field(const std::string& text, std::string_view field) {
            task_priority parsed{task_priority::normal};
            if (!try_parse_task_priority(text, parsed)) {
                throw invalid_configuration_error{
                        "invalid {}: {} (expected low|normal|high|critical)"_format(field, text)};
            }
            return parsed;
        }

        static persisted_engine_config make_persisted(const engine_config& cfg) {
            persisted_engine_config data{};
            data.executor.workers = static_cast<uint32_t>(cfg.executor.workers);
            data.executor.task_timeout_ms = cfg.executor.task_timeout.count();
            data.executor.max_attempts = cfg.executor.max_attempts;
            data.executor.backoff_base_ms = cfg.executor.backoff_base.count();
            data.executor.backoff_cap_ms = cfg.executor.backoff_cap.count();

            data.state.history_depth = static_cast<uint32_t>(cfg.state.history_depth);
            data.state.persist_every_revisions = cfg.state.persist_every_revisions;
            data.state.persist_interval_ms = cfg.state.persist_interval.count();

            data.planner.content_priority = std::string{to_string(cfg.planner.content_priority)};
            data.planner.speech_priority = std::string{to_string(cfg.planner.speech_priority)};
            data.planner.visual_priority = std::string{to_string(cfg.planner.visual_priority)};
            data.planner.integration_priority = std::string{to_string(cfg.planner.integration_priority)};
            data.planner.feedback_priority = std::string{to_string(cfg.planner.feedback_priority)};

            const auto& a = cfg.adaptation;
            data.adaptation.window_size = static_cast<uint32_t>(a.window_size);
            data.adaptation.sessions_per_cycle = static_cast<uint32_t>(a.sessions_per_cycle);
            data.adaptation.event_log_capacity = static_cast<uint32_t>(a.event_log_capacity);
            data.adaptation.auto_cycle = a.auto_cycle;
            data.adaptation.parameters = a.parameters;
            for (const auto& [name, b] : a.bounds) {
                data.adaptation.bounds.emplace(name, persisted_bounds{b.min, b.max});
            }
            for (const auto& rule : a.rules) {
                data.adaptation.rules.push_back(persisted_rule{
                        .name = rule.name,
                        .priority = rule.priority,
                        .enabled = rule.enabled,
                        .metric = rule.condition.metric,
                        .statistic = std::string{to_string(rule.condition.statistic)},
                        .comparison = std::string{to_string(rule.condition.op)},
                        .threshold = rule.condition.threshold,
                        .consecutive_windows = rule.condition.consecutive_windows,
                        .parameter = rule.action.parameter,
                        .delta = rule.action.delta});
            }
            return data;
        }

        static engine_config apply_persisted(const persisted_engine_config& data) {
            engine_config cfg{};
            if (data.executor.task_timeout_ms < 0 || data.executor.backoff_base_ms < 0 ||
                data.executor.backoff_cap_ms < 0 || data.state.persist_interval_ms < 0) {
                throw invalid_configuration_error{"durations must not be negative"};
            }

            cfg.executor.workers = data.executor.workers;
            cfg.executor.task_timeout = std::chrono::milliseconds{data.executor.task_timeout_ms};
            cfg.executor.max_attempts = data.executor.max_attempts;
            cfg.executor.backoff_base = std::chrono::milliseconds{data.executor.backoff_base_ms};
            cfg.executor.backoff_cap = std::chrono::milliseconds{data.executor.backoff_cap_ms};

            cfg.state.history_depth = data.state.history_depth;
            cfg.state.persist_every_revisions = data.state.persist_every_revisions;
            cfg.state.persist_interval = std::chrono::milliseconds{data.state.persist_interval_ms};

            cfg.planner.content_priority = parse_priority_field(data.planner.content_priority, "content_priority"sv);
            cfg.planner.speech_priority = parse_priority_field(data.planner.speech_priority, "speech_priority"sv);
            cfg.planner.visual_priority = parse_priority_field(data.planner.visual_priority, "visual_priority"sv);
            cfg.planner.integration_priority =
                    parse_priority_field(data.planner.integration_priority, "integration_priority"sv);
            cfg.planner.feedback_priority = parse_priority_field(data.planner.feedback_priority, "feedback_priority"sv);

            auto& a = cfg.adaptation;
            a.window_size = data.adaptation.window_size;
            a.sessions_per_cycle = data.adaptation.sessions_per_cycle;
            a.event_log_capacity = data.adaptation.event_log_capacity;
            a.auto_cycle = data.adaptation.auto_cycle;
            a.parameters = data.adaptation.parameters;
            for (const auto& [name, b] : data.adaptation.bounds) {
                a.bounds.emplace(name, parameter_bounds{b.min, b.max});
            }
            for (const auto& rule : data.adaptation.rules) {
                adaptation_rule parsed{};
                parsed.name = rule.name;
                parsed.priority = rule.priority;
                parsed.enabled = rule.enabled;
                parsed.condition.metric = rule.metric;
                parsed.condition.threshold = rule.threshold;
                parsed.condition.consecutive_windows = rule.consecutive_windows;
                parsed.action = rule_action{rule.parameter, rule.delta};
                if (!try_parse_metric_statistic(rule.statistic, parsed.condition.statistic)) {
                    throw invalid_configuration_error{
                            "rule {}: invalid statistic {} (expected mean|p95|min|max|last|slope)"_format(
                                    rule.name, rule.statistic)};
                }
                if (!try_parse_comparison(rule.comparison, parsed.condition.op)) {
                    throw invalid_configuration_error{
                            "rule {}: invalid comparison {} (expected lt|le|gt|ge)"_format(rule.name, rule.comparison)};
                }
                a.rules.push_back(std::move(parsed));
            }
            return cfg;
        }

    }  // namespace detail

    param_map default_parameters() {
        return param_map{
                {"speech.threshold", 0.7},
                {"visual.threshold", 0.6},
                {"content.threshold", 0.8},
                {"confidence_threshold", 0.75},
                {"adaptation_sensitivity", 0.1},
                {"integration.weight.speech", 0.3},
                {"integration.weight.visual", 0.3},
                {"integration.weight.content", 0.4},
        };
    }

    std::map<std::string, parameter_bounds> default_parameter_bounds() {
        return std::map<std::string, parameter_bounds>{
                {"speech.threshold", {0.3, 0.95}},
                {"visual.threshold", {0.3, 0.95}},
                {"content.threshold", {0.3, 0.95}},
                {"confidence_threshold", {0.3, 0.95}},
                {"adaptation_sensitivity", {0.01, 0.5}},
                {"integration.weight.speech", {0.0, 1.0}},
                {"integration.weight.visual", {0.0, 1.0}},
                {"integration.weight.content", {0.0, 1.0}},
        };
    }

    std::vector<adaptation_rule> default_adaptation_rules() {
        std::vector<adaptation_rule> rules{};

        adaptation_rule accuracy{};
        accuracy.name = "accuracy_below_threshold";
        accuracy.priority = 3;
        accuracy.condition = threshold_condition{"session.overall_score", metric_statistic::mean, comparison::less_than, 0.7};
        accuracy.action = rule_action{"content.threshold", -0.05};
        rules.push_back(std::move(accuracy));

        adaptation_rule confidence{};
        confidence.name = "confidence_low";
        confidence.priority = 2;
        confidence.condition = threshold_condition{"session.confidence", metric_statistic::mean, comparison::less_than, 0.6};
        confidence.action = rule_action{"confidence_threshold", -0.05};
        rules.push_back(std::move(confidence));

        adaptation_rule feedback{};
        feedback.name = "feedback_negative";
        feedback.priority = 1;
        feedback.condition = threshold_condition{"session.overall_score", metric_statistic::min, comparison::less_than, 0.5};
        feedback.action = rule_action{"speech.threshold", -0.05};
        rules.push_back(std::move(feedback));

        return rules;
    }

    engine_config default_engine_config() {
        engine_config cfg{};
        cfg.adaptation.parameters = default_parameters();
        cfg.adaptation.bounds = default_parameter_bounds();
        cfg.adaptation.rules = default_adaptation_rules();
        return cfg;
    }

    void validate_engine_config(const engine_config& cfg) {
        const auto& e = cfg.executor;
        if (e.workers == 0U) {
            throw invalid_configuration_error{"executor.workers must be at least 1"};
        }
        if (e.task_timeout.count() <= 0) {
            throw invalid_configuration_error{"executor.task_timeout_ms must be positive"};
        }
        if (e.max_attempts == 0U) {
            throw invalid_configuration_error{"executor.max_attempts must be at least 1"};
        }
        if (e.backoff_cap < e.backoff_base) {
            throw invalid_configuration_error{"executor.backoff_cap_ms must not be below backoff_base_ms"};
        }

        if (cfg.state.history_depth == 0U) {
            throw invalid_configuration_error{"state.history_depth must be at least 1"};
        }
        if (cfg.state.persist_every_revisions == 0U) {
            throw invalid_configuration_error{"state.persist_every_revisions must be at least 1"};
        }

        const auto& a = cfg.adaptation;
        if (a.window_size == 0U) {
            throw invalid_configuration_error{"adaptation.window_size must be at least 1"};
        }
        if (a.sessions_per_cycle == 0U) {
            throw invalid_configuration_error{"adaptation.sessions_per_cycle must be at least 1"};
        }
        if (a.event_log_capacity == 0U) {
            throw invalid_configuration_error{"adaptation.event_log_capacity must be at least 1"};
        }

        for (const auto& [name, b] : a.bounds) {
            if (!std::isfinite(b.min) || !std::isfinite(b.max) || b.min > b.max) {
                throw invalid_configuration_error{"adaptation.bounds.{}: min must not exceed max"_format(name)};
            }
        }
        for (const auto& [name, value] : a.parameters) {
            if (!std::isfinite(value)) {
                throw invalid_configuration_error{"adaptation.parameters.{} is not finite"_format(name)};
            }
            if (auto it = a.bounds.find(name); it != a.bounds.end() && (value < it->second.min || value > it->second.max)) {
                throw invalid_configuration_error{
                        "adaptation.parameters.{}={} outside bounds [{}, {}]"_format(
                                name, value, it->second.min, it->second.max)};
            }
        }

        std::set<std::string> names{};
        for (const auto& rule : a.rules) {
            if (rule.name.empty()) {
                throw invalid_configuration_error{"adaptation rule without a name"};
            }
            if (!names.insert(rule.name).second) {
                throw invalid_configuration_error{"duplicate adaptation rule: {}"_format(rule.name)};
            }
            if (!a.parameters.contains(rule.action.parameter)) {
                throw invalid_configuration_error{
                        "rule {} adjusts unknown parameter {}"_format(rule.name, rule.action.parameter)};
            }
            if (!rule.predicate && rule.condition.metric.empty()) {
                throw invalid_configuration_error{"rule {} has no metric"_format(rule.name)};
            }
            if (rule.condition.consecutive_windows == 0U) {
                throw invalid_configuration_error{"rule {}: consecutive_windows must be at least 1"_format(rule.name)};
            }
        }
    }

    engine_config parse_engine_config(std::string_view json, std::string_view origin) {
        internal::persisted_engine_config data{};
        try {
            data = internal::from_json(detail::make_persisted(default_engine_config()), json, origin);
            internal::validate_supported_schema_version(data.schema_version, origin);
        } catch (const error& e) {
            throw invalid_configuration_error{e.what()};
        }
        auto cfg = detail::apply_persisted(data);
        validate_engine_config(cfg);
        return cfg;
    }

    engine_config load_engine_config(const std::filesystem::path& path) {
        return parse_engine_config(internal::read_text_file(path), path.string());
    }

    std::string engine_config_to_json(const engine_config& cfg) {
        return internal::to_json(detail::make_persisted(cfg), "engine config"sv);
    }

}  // namespace parley
