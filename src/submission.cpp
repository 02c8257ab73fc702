#include "parley/submission.hpp"

#include "internal/json_io.hpp"

using namespace parley::literals;

namespace parley {
    namespace detail {

        using internal::persisted_input;

        static std::optional<modality_input> to_input(const std::optional<persisted_input>& input) {
            if (!input) {
                return std::nullopt;
            }
            return modality_input{input->ref, input->text, input->features};
        }

    }  // namespace detail

    submission parse_submission(std::string_view json, std::string_view origin) {
        auto record = internal::from_json(internal::persisted_submission{}, json, origin);

        submission out{};
        out.context.session_id = record.session_id;
        out.context.job_position = record.job_position;
        out.context.focus_weights = record.focus_weights;
        if (!try_parse_analysis_mode(record.mode, out.context.mode)) {
            throw error{"{}: invalid mode '{}' (expected quick|full)"_format(origin, record.mode)};
        }
        out.inputs.transcript = detail::to_input(record.transcript);
        out.inputs.audio = detail::to_input(record.audio);
        out.inputs.video = detail::to_input(record.video);
        return out;
    }

    submission load_submission(const std::filesystem::path& path) {
        return parse_submission(internal::read_text_file(path), path.string());
    }

    std::string report_to_json(const session_report& report) {
        internal::report_output_record record{};
        record.session_id = report.session_id;
        record.outcome = std::string{to_string(report.outcome)};
        record.partial = report.partial;
        record.overall_score = report.overall_score;
        record.strengths = report.strengths;
        record.weaknesses = report.weaknesses;
        record.suggestions = report.suggestions;
        for (const auto& [kind, summary] : report.modalities) {
            record.modalities.emplace(
                    std::string{to_string(kind)},
                    internal::persisted_modality_summary{
                            std::string{to_string(summary.status)}, summary.score, summary.confidence, summary.error});
        }
        return internal::to_json(record, "session report");
    }

}  // namespace parley
