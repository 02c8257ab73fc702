#include "parley/report.hpp"

#include "parley/format.hpp"
#include "parley/graph_state.hpp"

#include <algorithm>
#include <array>
#include <set>

using namespace parley::literals;

namespace parley {
    namespace detail {

        struct suggestion_entry {
            std::string_view item;
            std::string_view text;
        };

        // Keyed by score name; the first matching entry for a weak score supplies the suggestion.
        static constexpr std::array suggestion_table{
                suggestion_entry{"clarity"sv, "improve articulation and keep a steady pace so every word is heard"sv},
                suggestion_entry{"pace"sv, "adjust the speaking rate, avoid rushing or dragging"sv},
                suggestion_entry{"fluency"sv, "practice answers aloud to reduce hesitations and filler words"sv},
                suggestion_entry{"tone"sv, "vary intonation to avoid sounding monotone"sv},
                suggestion_entry{"volume"sv, "adjust volume so the interviewer can hear clearly"sv},
                suggestion_entry{"pronunciation"sv, "work on pronunciation of key terms"sv},
                suggestion_entry{"facial_expression"sv, "use more expressive facial expressions to show confidence"sv},
                suggestion_entry{"posture"sv, "keep an upright but relaxed posture"sv},
                suggestion_entry{"eye_contact"sv, "maintain more eye contact to show focus and confidence"sv},
                suggestion_entry{"gestures"sv, "use gestures sparingly to reinforce key points"sv},
                suggestion_entry{"relevance"sv, "keep answers focused on the question that was asked"sv},
                suggestion_entry{"structure"sv, "organize answers with a clear beginning, body and conclusion"sv},
                suggestion_entry{"depth"sv, "add concrete examples and deeper analysis"sv},
                suggestion_entry{"keyword_coverage"sv, "mention the core concepts the role calls for"sv},
        };

        static constexpr std::string_view keep_going = "keep up the good performance"sv;

        static std::optional<std::string_view> suggestion_for(modality m, std::string_view item) {
            // content and speech both report "clarity"; content clarity is about wording
            if (m == modality::content && item == "clarity"sv) {
                return "state points plainly and avoid ambiguous phrasing"sv;
            }
            for (const auto& entry : suggestion_table) {
                if (entry.item == item) {
                    return entry.text;
                }
            }
            return std::nullopt;
        }

        static const task* modality_task(const graph_state& state, modality m) {
            auto planned = state.tasks.tasks_of(task_type_for(m));
            return planned.empty() ? nullptr : planned.front();
        }

        static const task* integration_task(const graph_state& state) {
            auto planned = state.tasks.tasks_of(task_type::integration);
            return planned.empty() ? nullptr : planned.front();
        }

        static modality_summary summarize(const graph_state& state, const task& t, modality m) {
            modality_summary summary{};
            if (t.status == task_status::succeeded) {
                summary.status = modality_status::ok;
                if (const auto* result = state.analysis.find(m)) {
                    summary.score = modality_score(result->scores);
                    summary.confidence = result->confidence;
                }
                return summary;
            }
            if (t.is_terminal()) {
                summary.status = modality_status::degraded;
                summary.error = t.last_error ? t.last_error : std::optional<std::string>{std::string{to_string(t.status)}};
                return summary;
            }
            summary.status = modality_status::pending;
            return summary;
        }

        static session_outcome decide_outcome(const graph_state& state, const session_report& report) {
            if (state.tasks.count(task_status::cancelled) > 0U) {
                return session_outcome::cancelled;
            }
            if (state.tasks.empty() || !state.tasks.all_terminal()) {
                return session_outcome::running;
            }

            bool any_ok = false;
            for (const auto& [_, summary] : report.modalities) {
                any_ok = any_ok || summary.status == modality_status::ok;
            }
            if (!report.modalities.empty() && !any_ok) {
                return session_outcome::failed;
            }
            if (const auto* integration = integration_task(state);
                integration != nullptr && integration->status == task_status::failed) {
                return session_outcome::failed;
            }
            return report.partial ? session_outcome::partial : session_outcome::completed;
        }

    }  // namespace detail

    double modality_weight(modality m, const param_map& params, const param_map& focus_weights) {
        auto weight = default_modality_weight(m);
        if (auto it = params.find("integration.weight.{}"_format(m)); it != params.end()) {
            weight = it->second;
        }
        if (auto it = focus_weights.find(std::string{to_string(m)}); it != focus_weights.end()) {
            weight *= it->second;
        }
        return std::max(weight, 0.0);
    }

    std::optional<double> modality_score(const std::map<std::string, double>& scores) {
        if (scores.empty()) {
            return std::nullopt;
        }
        double sum = 0.0;
        for (const auto& [_, value] : scores) {
            sum += value;
        }
        return sum / static_cast<double>(scores.size());
    }

    session_report build_report(const graph_state& state) {
        session_report report{};
        report.session_id = state.session_id;

        for (auto m : {modality::content, modality::speech, modality::visual}) {
            if (const auto* t = detail::modality_task(state, m)) {
                auto summary = detail::summarize(state, *t, m);
                report.partial = report.partial || summary.status == modality_status::degraded;
                report.modalities.emplace(m, std::move(summary));
            }
        }

        // Weights come from the integration task's frozen params when it exists.
        const auto* integration = detail::integration_task(state);
        const auto& weight_params = integration != nullptr ? integration->input_params : state.parameters;

        double weighted = 0.0;
        double total_weight = 0.0;
        std::set<std::string> suggested{};
        for (const auto& [m, summary] : report.modalities) {
            if (summary.status != modality_status::ok) {
                continue;
            }
            if (summary.score) {
                auto w = modality_weight(m, weight_params, state.context.focus_weights);
                weighted += w * *summary.score;
                total_weight += w;
            }

            const auto* result = state.analysis.find(m);
            if (result == nullptr) {
                continue;
            }
            for (const auto& [item, value] : result->scores) {
                if (value >= strength_threshold) {
                    report.strengths.push_back("{} - {}: {:.2f}"_format(m, item, value));
                }
                else if (value < weakness_threshold) {
                    report.weaknesses.push_back("{} - {}: {:.2f}"_format(m, item, value));
                    if (auto text = detail::suggestion_for(m, item); text && suggested.emplace(*text).second) {
                        report.suggestions.emplace_back(*text);
                    }
                }
            }
        }

        if (total_weight > 0.0) {
            report.overall_score = weighted / total_weight;
        }
        if (report.suggestions.empty() && total_weight > 0.0 && report.weaknesses.empty()) {
            report.suggestions.emplace_back(detail::keep_going);
        }

        report.outcome = detail::decide_outcome(state, report);
        return report;
    }

}  // namespace parley
