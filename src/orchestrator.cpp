#include "parley/orchestrator.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"
#include "parley/planner.hpp"

#include <chrono>
#include <exception>
#include <random>
#include <vector>

using namespace parley::literals;

namespace parley {

    std::string make_session_id() {
        auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        std::random_device rd{};
        std::uniform_int_distribution<uint32_t> dist{};
        return "s-{:%Y%m%d%H%M%S}-{:08x}"_format(now, dist(rd));
    }

    orchestrator::orchestrator(
            state_manager& state, adaptation_engine& adaptation, capability_set capabilities, engine_config cfg)
            : state_{state}, adaptation_{adaptation}, capabilities_{std::move(capabilities)}, cfg_{std::move(cfg)} {
        validate_engine_config(cfg_);
    }

    orchestrator::~orchestrator() {
        std::map<std::string, std::shared_ptr<session_run>, std::less<>> runs{};
        {
            std::lock_guard lock{runs_mutex_};
            runs.swap(runs_);
        }
        for (auto& [id, run] : runs) {
            run->stop.request_stop();
            if (run->thread.joinable()) {
                run->thread.join();
            }
        }
    }

    std::string orchestrator::start_session(user_context context, session_inputs inputs, progress_stream* progress) {
        reap_finished();
        if (context.session_id.empty()) {
            context.session_id = make_session_id();
        }
        auto id = context.session_id;
        if (state_.contains(id) || (state_.store() && state_.store()->latest_revision(id))) {
            throw error{"session {} already exists"_format(id)};
        }

        auto global = state_.snapshot(global_session_id);
        graph_state initial{};
        initial.session_id = id;
        initial.context = std::move(context);
        initial.inputs = std::move(inputs);
        initial.parameters = global.parameters;
        initial.bounds = global.bounds;

        auto tasks = plan(initial.context, initial.inputs, initial.parameters, cfg_.planner, cfg_.executor.max_attempts);
        // rejects a cyclic plan before the session exists
        task_graph{}.add(tasks);

        auto mode = initial.context.mode;
        auto planned = tasks.size();
        state_.create_session(std::move(initial));
        state_.apply(id, mutation::add_tasks{std::move(tasks)});
        if (progress != nullptr) {
            *progress = state_.subscribe(id);
        }

        launch(id, false);
        log_info("started session ", id, " (", mode, ", ", planned, " tasks)");
        return id;
    }

    graph_state orchestrator::get_session_state(std::string_view session_id, std::optional<uint64_t> revision) const {
        return state_.snapshot(session_id, revision);
    }

    void orchestrator::cancel_session(std::string_view session_id) {
        std::lock_guard lock{runs_mutex_};
        if (auto it = runs_.find(session_id); it != runs_.end()) {
            if (it->second->stop.request_stop()) {
                log_info("cancelling session ", session_id);
            }
            return;
        }
        // planned but not launched yet
        if (state_.contains(session_id)) {
            if (pending_cancels_.emplace(session_id).second) {
                log_info("cancelling session ", session_id, " before launch");
            }
            return;
        }
        if (!state_.store() || !state_.store()->latest_revision(session_id)) {
            throw unknown_session_error{session_id};
        }
    }

    progress_stream orchestrator::subscribe_progress(std::string_view session_id) {
        return state_.subscribe(session_id);
    }

    session_report orchestrator::wait(std::string_view session_id) {
        auto run = find_run(session_id);
        if (!run) {
            return state_.snapshot(session_id).feedback;
        }
        auto report = run->done.get();
        reap_finished();
        return report;
    }

    void orchestrator::resume_session(std::string_view session_id, progress_stream* progress) {
        if (running(session_id)) {
            throw error{"session {} is still running"_format(session_id)};
        }
        reap_finished();
        if (state_.contains(session_id)) {
            state_.close_session(session_id);
        }

        auto restored = state_.resume(session_id);
        if (progress != nullptr) {
            *progress = state_.subscribe(session_id);
        }
        launch(restored.session_id, true);
    }

    bool orchestrator::running(std::string_view session_id) const {
        auto run = find_run(session_id);
        return run && run->done.wait_for(std::chrono::seconds{0}) != std::future_status::ready;
    }

    std::shared_ptr<orchestrator::session_run> orchestrator::find_run(std::string_view session_id) const {
        std::lock_guard lock{runs_mutex_};
        auto it = runs_.find(session_id);
        return it == runs_.end() ? nullptr : it->second;
    }

    void orchestrator::reap_finished() {
        std::vector<std::shared_ptr<session_run>> finished{};
        {
            std::lock_guard lock{runs_mutex_};
            for (auto it = runs_.begin(); it != runs_.end();) {
                if (it->second->done.wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
                    finished.push_back(std::move(it->second));
                    it = runs_.erase(it);
                }
                else {
                    ++it;
                }
            }
        }
        // joined here, outside the lock
        for (auto& run : finished) {
            if (run->thread.joinable()) {
                run->thread.join();
            }
        }
    }

    void orchestrator::launch(const std::string& session_id, bool resumed) {
        auto promise = std::make_shared<std::promise<session_report>>();
        auto run = std::make_shared<session_run>();
        run->done = promise->get_future().share();

        std::lock_guard lock{runs_mutex_};
        if (auto pending = pending_cancels_.find(session_id); pending != pending_cancels_.end()) {
            pending_cancels_.erase(pending);
            run->stop.request_stop();
        }
        run->thread = std::jthread{[this, session_id, resumed, promise, stop = run->stop.get_token()] {
            try {
                parallel_executor executor{state_, capabilities_, cfg_.executor};
                auto summary = executor.run(session_id, stop);
                state_.close_session(session_id);
                // a resumed session with nothing left to run was already counted
                auto skip_metrics = summary.cancelled || (resumed && summary.attempts.empty());
                if (!skip_metrics) {
                    adaptation_.record_session(summary);
                }
                log_info(
                        "session ",
                        session_id,
                        " ",
                        summary.report.outcome,
                        " after ",
                        summary.attempts.size(),
                        " attempts");
                promise->set_value(std::move(summary.report));
            } catch (const std::exception& e) {
                auto failure = std::current_exception();
                log_error("session ", session_id, " stopped: ", e.what());
                try {
                    if (state_.contains(session_id)) {
                        state_.close_session(session_id);
                    }
                } catch (const std::exception& close_error) {
                    log_error("session ", session_id, " could not be closed: ", close_error.what());
                }
                promise->set_exception(failure);
            }
        }};
        runs_.insert_or_assign(session_id, std::move(run));
    }

}  // namespace parley
