#pragma once

#include "graph_state.hpp"
#include "report.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace parley {

    // One interview submission as handed to the command line front end.
    struct submission {
        user_context context{};
        session_inputs inputs{};
    };

    // Throws error on malformed JSON or an unknown analysis mode.
    submission parse_submission(std::string_view json, std::string_view origin = "<memory>"sv);
    submission load_submission(const std::filesystem::path& path);

    std::string report_to_json(const session_report& report);

}  // namespace parley
