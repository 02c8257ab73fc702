#pragma once

#include "config.hpp"
#include "graph_state.hpp"

#include <vector>

namespace parley {

    // Stable task ids within a session, one per stage.
    namespace stage_ids {
        inline constexpr task_id content = 1U;
        inline constexpr task_id speech = 2U;
        inline constexpr task_id visual = 3U;
        inline constexpr task_id integration = 4U;
        inline constexpr task_id feedback = 5U;
    }  // namespace stage_ids

    task_id stage_id(task_type type);

    // Modalities the mode asks for, before input gating.
    std::vector<modality> modalities_for(analysis_mode mode);

    /*
     * Builds the session's task set.
     *
     * One analysis task per requested modality whose input exists, an Integration task
     * (best effort) depending on all of them, and a Feedback task depending on Integration.
     * Each task's params are frozen from `parameters` at planning time: the keys under the
     * task's stage prefix, every un-prefixed key, and the user's focus weights as
     * `focus.<name>`.
     */
    std::vector<planned_task> plan(
            const user_context& context,
            const session_inputs& inputs,
            const param_map& parameters,
            const planner_config& cfg = {},
            uint32_t max_attempts = 3U);

}  // namespace parley
