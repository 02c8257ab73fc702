#pragma once

#include "report.hpp"
#include "task_graph.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace parley {

    enum class analysis_mode : uint8_t { quick, full };

    inline constexpr std::string_view to_string(analysis_mode mode) {
        switch (mode) {
            case analysis_mode::quick:
                return "quick"sv;
            case analysis_mode::full:
                return "full"sv;
        }
        return "quick"sv;
    }

    inline constexpr bool try_parse_analysis_mode(std::string_view text, analysis_mode& out) {
        if (utils::str_case_eq(text, "quick"sv)) {
            out = analysis_mode::quick;
            return true;
        }
        if (utils::str_case_eq(text, "full"sv)) {
            out = analysis_mode::full;
            return true;
        }
        return false;
    }

    // Immutable once produced; shared between revisions rather than copied.
    struct analysis_result {
        task_id source_task{};
        modality kind{modality::content};
        std::map<std::string, double> scores{};
        std::string raw_features{};
        double confidence{};
        timestamp produced_at{};

        bool operator==(const analysis_result&) const = default;
    };

    using result_ref = std::shared_ptr<const analysis_result>;

    struct analysis_state {
        std::map<modality, result_ref> results{};

        // Last write wins for the modality slot.
        void record(result_ref result) {
            auto kind = result->kind;
            results.insert_or_assign(kind, std::move(result));
        }

        const analysis_result* find(modality m) const {
            auto it = results.find(m);
            return it == results.end() ? nullptr : it->second.get();
        }

        bool operator==(const analysis_state& other) const {
            if (results.size() != other.results.size()) {
                return false;
            }
            for (const auto& [kind, ref] : results) {
                const auto* theirs = other.find(kind);
                if (theirs == nullptr || ref == nullptr || !(*ref == *theirs)) {
                    return false;
                }
            }
            return true;
        }
    };

    struct user_context {
        std::string session_id{};
        std::string job_position{};
        analysis_mode mode{analysis_mode::quick};
        std::map<std::string, double> focus_weights{};

        bool operator==(const user_context&) const = default;
    };

    struct modality_input {
        std::string ref{};
        std::string text{};
        std::map<std::string, double> features{};

        bool operator==(const modality_input&) const = default;
    };

    struct session_inputs {
        std::optional<modality_input> transcript{};
        std::optional<modality_input> audio{};
        std::optional<modality_input> video{};

        bool operator==(const session_inputs&) const = default;

        // Content analysis works from the transcript, or from the audio track's transcription.
        const modality_input* input_for(modality m) const {
            switch (m) {
                case modality::speech:
                    return audio ? &*audio : nullptr;
                case modality::visual:
                    return video ? &*video : nullptr;
                case modality::content:
                    if (transcript) {
                        return &*transcript;
                    }
                    return audio ? &*audio : nullptr;
            }
            return nullptr;
        }

        bool available(modality m) const { return input_for(m) != nullptr; }
    };

    struct parameter_bounds {
        double min{};
        double max{};

        bool operator==(const parameter_bounds&) const = default;

        double clamp(double value) const { return value < min ? min : (value > max ? max : value); }
    };

    // Session-scoped aggregate; the single unit of mutation, persistence and rollback.
    struct graph_state {
        std::string session_id{};
        user_context context{};
        session_inputs inputs{};
        task_graph tasks{};
        analysis_state analysis{};
        param_map parameters{};
        std::map<std::string, parameter_bounds> bounds{};
        feedback_state feedback{};
        uint64_t revision{};

        bool operator==(const graph_state&) const = default;
    };

    // Id of the pseudo-session that carries adaptation parameters between real sessions.
    inline constexpr std::string_view global_session_id = "__global__"sv;

    namespace mutation {
        struct add_task {
            task value{};
            std::vector<task_id> dependencies{};
        };

        struct add_tasks {
            std::vector<planned_task> batch{};
        };

        struct transition_task {
            task_id id{};
            task_status to{task_status::pending};
            std::optional<std::string> error{};
            std::optional<timestamp> eligible_at{};
            // Failed without retry, whatever attempts remain.
            bool permanent{false};
        };

        struct record_result {
            result_ref result{};
        };

        // Deltas are added to the current values and clamped to the session's bounds.
        struct adjust_params {
            param_map deltas{};
        };

        // Installs `bounds` as the session's bounds, adds the parameters it lacks and clamps
        // every value into its bounds. With `reset`, values are replaced by `parameters`.
        struct configure_params {
            param_map parameters{};
            std::map<std::string, parameter_bounds> bounds{};
            bool reset{false};
        };
    }  // namespace mutation

    using state_mutation = std::variant<
            mutation::add_task,
            mutation::add_tasks,
            mutation::transition_task,
            mutation::record_result,
            mutation::adjust_params,
            mutation::configure_params>;

    std::string_view describe(const state_mutation& m);

    // Applies one mutation in place and refreshes the derived feedback. Throws on invalid input,
    // possibly leaving `state` half-updated; state_manager always applies to a working copy.
    void apply_mutation(graph_state& state, const state_mutation& m, timestamp at);

}  // namespace parley
