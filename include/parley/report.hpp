#pragma once

#include "task.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

    struct graph_state;

    enum class modality_status : uint8_t {
        ok,
        degraded,
        pending,
        absent,
    };

    inline constexpr std::string_view to_string(modality_status status) {
        switch (status) {
            case modality_status::ok:
                return "ok"sv;
            case modality_status::degraded:
                return "degraded"sv;
            case modality_status::pending:
                return "pending"sv;
            case modality_status::absent:
                return "absent"sv;
        }
        return "absent"sv;
    }

    enum class session_outcome : uint8_t {
        running,
        completed,
        partial,
        failed,
        cancelled,
    };

    inline constexpr std::string_view to_string(session_outcome outcome) {
        switch (outcome) {
            case session_outcome::running:
                return "running"sv;
            case session_outcome::completed:
                return "completed"sv;
            case session_outcome::partial:
                return "partial"sv;
            case session_outcome::failed:
                return "failed"sv;
            case session_outcome::cancelled:
                return "cancelled"sv;
        }
        return "running"sv;
    }

    struct modality_summary {
        modality_status status{modality_status::absent};
        std::optional<double> score{};
        std::optional<double> confidence{};
        std::optional<std::string> error{};

        bool operator==(const modality_summary&) const = default;
    };

    /*
     * Feedback view over a session. Derived from the analysis results and task
     * statuses; never persisted and always rebuildable with build_report().
     *
     * - modalities: one entry per modality, absent when no task was planned for it.
     * - overall_score: weighted mean over modalities with a result.
     * - partial: at least one planned modality ended degraded.
     * - strengths/weaknesses/suggestions: drawn only from modalities that succeeded.
     */
    struct session_report {
        std::string session_id{};
        session_outcome outcome{session_outcome::running};
        bool partial{false};
        std::map<modality, modality_summary> modalities{};
        std::optional<double> overall_score{};
        std::vector<std::string> strengths{};
        std::vector<std::string> weaknesses{};
        std::vector<std::string> suggestions{};

        bool operator==(const session_report&) const = default;

        modality_status status_of(modality m) const {
            auto it = modalities.find(m);
            return it == modalities.end() ? modality_status::absent : it->second.status;
        }
    };

    using feedback_state = session_report;

    inline constexpr double strength_threshold = 0.8;
    inline constexpr double weakness_threshold = 0.7;

    // Default modality weights for the overall score; overridden by integration.weight.<modality>.
    inline constexpr double default_modality_weight(modality m) {
        switch (m) {
            case modality::speech:
                return 0.3;
            case modality::visual:
                return 0.3;
            case modality::content:
                return 0.4;
        }
        return 0.0;
    }

    double modality_weight(modality m, const param_map& params, const param_map& focus_weights);

    std::optional<double> modality_score(const std::map<std::string, double>& scores);

    session_report build_report(const graph_state& state);

}  // namespace parley
