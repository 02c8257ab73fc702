#include "parley/planner.hpp"

#include "parley/format.hpp"

using namespace parley::literals;

namespace parley {
    namespace detail {

        static std::string_view stage_prefix(task_type type) {
            switch (type) {
                case task_type::content_analysis:
                    return "content"sv;
                case task_type::speech_analysis:
                    return "speech"sv;
                case task_type::visual_analysis:
                    return "visual"sv;
                case task_type::integration:
                    return "integration"sv;
                case task_type::feedback:
                    return "feedback"sv;
            }
            return ""sv;
        }

        static param_map freeze_params(task_type type, const param_map& parameters, const user_context& context) {
            auto prefix = stage_prefix(type);
            param_map out{};
            for (const auto& [key, value] : parameters) {
                auto dot = key.find('.');
                if (dot == std::string::npos) {
                    out.emplace(key, value);
                }
                else if (std::string_view{key}.substr(0, dot) == prefix) {
                    out.emplace(key, value);
                }
            }
            for (const auto& [name, weight] : context.focus_weights) {
                out.insert_or_assign("focus.{}"_format(name), weight);
            }
            return out;
        }

    }  // namespace detail

    task_id stage_id(task_type type) {
        switch (type) {
            case task_type::content_analysis:
                return stage_ids::content;
            case task_type::speech_analysis:
                return stage_ids::speech;
            case task_type::visual_analysis:
                return stage_ids::visual;
            case task_type::integration:
                return stage_ids::integration;
            case task_type::feedback:
                return stage_ids::feedback;
        }
        return 0U;
    }

    std::vector<modality> modalities_for(analysis_mode mode) {
        if (mode == analysis_mode::full) {
            return {modality::content, modality::speech, modality::visual};
        }
        return {modality::content, modality::speech};
    }

    std::vector<planned_task> plan(
            const user_context& context,
            const session_inputs& inputs,
            const param_map& parameters,
            const planner_config& cfg,
            uint32_t max_attempts) {
        std::vector<planned_task> out{};

        auto make = [&](task_type type) {
            task t{};
            t.id = stage_id(type);
            t.type = type;
            t.priority = cfg.priority_for(type);
            t.input_params = detail::freeze_params(type, parameters, context);
            t.max_attempts = max_attempts;
            return t;
        };

        std::vector<task_id> analysis_ids{};
        for (auto kind : modalities_for(context.mode)) {
            const auto* input = inputs.input_for(kind);
            if (input == nullptr) {
                log_debug(context.session_id, ": no input for ", kind, ", not planned");
                continue;
            }
            auto t = make(task_type_for(kind));
            t.input_ref = input->ref;
            analysis_ids.push_back(t.id);
            out.push_back(planned_task{std::move(t), {}});
        }

        auto integration = make(task_type::integration);
        integration.best_effort = true;
        out.push_back(planned_task{std::move(integration), analysis_ids});

        out.push_back(planned_task{make(task_type::feedback), {stage_ids::integration}});
        return out;
    }

}  // namespace parley
