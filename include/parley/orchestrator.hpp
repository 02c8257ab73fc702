#pragma once

#include "adaptation.hpp"
#include "capability.hpp"
#include "config.hpp"
#include "executor.hpp"
#include "state_manager.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace parley {

    // "s-<utc yyyymmddHHMMSS>-<8 hex>"; ids sort by creation time.
    std::string make_session_id();

    /*
     * Entry point for running analysis sessions.
     *
     * Each started session gets its own executor thread. A session is closed in the state
     * manager once its executor returns, so only running sessions stay in memory. The state
     * manager and the adaptation engine are owned by the caller and outlive the orchestrator.
     * Destroying the orchestrator cancels sessions that are still running and joins their
     * threads.
     */
    class orchestrator {
      public:
        orchestrator(
                state_manager& state,
                adaptation_engine& adaptation,
                capability_set capabilities,
                engine_config cfg = default_engine_config());
        ~orchestrator();

        orchestrator(const orchestrator&) = delete;
        orchestrator& operator=(const orchestrator&) = delete;

        // Plans and launches a session. Uses context.session_id when set. When `progress`
        // is given it is subscribed before the first task runs.
        std::string start_session(
                user_context context, session_inputs inputs, progress_stream* progress = nullptr);

        graph_state get_session_state(
                std::string_view session_id, std::optional<uint64_t> revision = std::nullopt) const;

        // Idempotent; a no-op for sessions that already finished. A live session whose run has
        // not started yet is cancelled as soon as it launches.
        void cancel_session(std::string_view session_id);

        progress_stream subscribe_progress(std::string_view session_id);

        // Blocks until the session's executor returns. Rethrows what stopped it, if anything.
        // Finished sessions are answered from the store.
        session_report wait(std::string_view session_id);

        // Reloads a stored session and runs whatever is left of it.
        void resume_session(std::string_view session_id, progress_stream* progress = nullptr);

        bool running(std::string_view session_id) const;

        const engine_config& config() const { return cfg_; }

      private:
        struct session_run {
            std::stop_source stop;
            std::shared_future<session_report> done;
            std::jthread thread;
        };

        void launch(const std::string& session_id, bool resumed);
        std::shared_ptr<session_run> find_run(std::string_view session_id) const;
        void reap_finished();

        state_manager& state_;
        adaptation_engine& adaptation_;
        capability_set capabilities_;
        engine_config cfg_;

        mutable std::mutex runs_mutex_;
        std::map<std::string, std::shared_ptr<session_run>, std::less<>> runs_;
        std::set<std::string, std::less<>> pending_cancels_;
    };

}  // namespace parley
