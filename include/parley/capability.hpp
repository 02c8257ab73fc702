#pragma once

#include "errors.hpp"
#include "graph_state.hpp"

#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace parley {

    struct deadline_context {
        std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
        std::stop_token stop{};

        bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
        bool stop_requested() const { return stop.stop_requested(); }

        // Analyzers poll this between stages and return the error as-is.
        std::optional<analyzer_error> check() const {
            if (stop_requested()) {
                return analyzer_error{analyzer_errc::cancelled, "stop requested"};
            }
            if (expired()) {
                return analyzer_error{analyzer_errc::deadline_exceeded, "deadline passed"};
            }
            return std::nullopt;
        }
    };

    // References stay valid for the whole call, even if the dispatching executor gives up on it.
    struct capability_request {
        task_id task{};
        modality kind{modality::content};
        uint32_t attempt{};
        std::string job_position{};
        const modality_input& input;
        const param_map& params;
        deadline_context deadline{};
    };

    using analysis_outcome = std::expected<analysis_result, analyzer_error>;

    // One analyzer per modality. analyze() is called concurrently from pool workers.
    class analyzer_capability {
      public:
        virtual ~analyzer_capability() = default;

        virtual modality kind() const = 0;
        virtual analysis_outcome analyze(const capability_request& request) = 0;
    };

    using capability_ptr = std::shared_ptr<analyzer_capability>;

    class capability_set {
      public:
        capability_set() = default;

        // Replaces any capability already registered for the same modality.
        capability_set& add(capability_ptr capability) {
            auto kind = capability->kind();
            by_modality_.insert_or_assign(kind, std::move(capability));
            return *this;
        }

        capability_ptr get(modality m) const {
            auto it = by_modality_.find(m);
            return it == by_modality_.end() ? nullptr : it->second;
        }

        bool contains(modality m) const { return by_modality_.contains(m); }
        size_t size() const { return by_modality_.size(); }

      private:
        std::map<modality, capability_ptr> by_modality_{};
    };

    /*
     * Built-in feature scorers. They work on pre-extracted features carried by the
     * submission (the providers that extract them live outside this library) and
     * score every item on a 0..1 scale.
     *
     *   speech:  spectral_centroid, zero_crossing_rate, tempo, rms, pause_ratio
     *   visual:  eye_contact, facial_expression, posture, gestures (0..1 or 0..10)
     *   content: the transcript text, scored against the job position
     */
    class speech_feature_analyzer final : public analyzer_capability {
      public:
        modality kind() const override { return modality::speech; }
        analysis_outcome analyze(const capability_request& request) override;
    };

    class visual_feature_analyzer final : public analyzer_capability {
      public:
        modality kind() const override { return modality::visual; }
        analysis_outcome analyze(const capability_request& request) override;
    };

    class content_feature_analyzer final : public analyzer_capability {
      public:
        modality kind() const override { return modality::content; }
        analysis_outcome analyze(const capability_request& request) override;
    };

    capability_set make_builtin_capabilities();

    // Rejects frozen params outside their domain (thresholds and weights in [0,1], finite values).
    std::optional<analyzer_error> validate_params(modality m, const param_map& params);

}  // namespace parley
