#pragma once

#include "adaptation.hpp"
#include "capability.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "format.hpp"
#include "graph_state.hpp"
#include "orchestrator.hpp"
#include "planner.hpp"
#include "report.hpp"
#include "snapshot_store.hpp"
#include "state_manager.hpp"
#include "submission.hpp"
#include "task.hpp"
#include "task_graph.hpp"
#include "utils.hpp"
