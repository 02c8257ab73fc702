#pragma once

#include "parley/parley.hpp"

#include <optional>

namespace parley::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run_session(const startup_config& cfg);

}  // namespace parley::cli
