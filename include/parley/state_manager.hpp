#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "graph_state.hpp"
#include "snapshot_store.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

    struct progress_event {
        std::string session_id{};
        task_id task{};
        task_type type{task_type::content_analysis};
        task_status status{task_status::pending};
        std::optional<modality> kind{};
        uint64_t revision{};

        bool operator==(const progress_event&) const = default;
    };

    // Subscriber end of a session's progress feed. Closed when the session ends.
    class progress_stream {
      public:
        progress_stream() = default;
        explicit progress_stream(std::shared_ptr<channel<progress_event>> ch) : ch_{std::move(ch)} {}

        // Blocks until an event arrives or the stream is closed and drained.
        std::optional<progress_event> next() { return ch_ ? ch_->pop() : std::nullopt; }

        template <typename Rep, typename Period>
        std::optional<progress_event> next_for(std::chrono::duration<Rep, Period> timeout) {
            return ch_ ? ch_->pop_for(timeout) : std::nullopt;
        }

        std::vector<progress_event> drain() { return ch_ ? ch_->drain() : std::vector<progress_event>{}; }
        bool closed() const { return !ch_ || ch_->closed(); }

      private:
        std::shared_ptr<channel<progress_event>> ch_{};
    };

    /*
     * Sole owner and mutator of session state.
     *
     * Each session has its own mutex; apply() holds it only while copying, mutating and
     * committing one revision. The registry lock guards session lookup only. Snapshots
     * go to the store every `persist_every_revisions` revisions or `persist_interval`,
     * whichever comes first, and on flush().
     */
    class state_manager {
      public:
        explicit state_manager(state_manager_config cfg = {}, std::shared_ptr<snapshot_store> store = nullptr);

        state_manager(const state_manager&) = delete;
        state_manager& operator=(const state_manager&) = delete;

        // Registers a new session at revision 0. Throws if the id is already live.
        uint64_t create_session(graph_state initial);

        // Registers the session if it is not live yet; returns its current revision.
        uint64_t ensure_session(graph_state initial);

        uint64_t apply(
                std::string_view session_id,
                const state_mutation& mutation,
                std::optional<uint64_t> expected_revision = std::nullopt);

        // Closed sessions are read back from the store.
        graph_state snapshot(std::string_view session_id, std::optional<uint64_t> revision = std::nullopt) const;
        uint64_t revision(std::string_view session_id) const;
        std::vector<uint64_t> history_revisions(std::string_view session_id) const;

        // Restores revision `k` and discards everything newer, in memory and in the store.
        void rollback(std::string_view session_id, uint64_t revision);

        // Reloads the latest stored snapshot of a session that is not live. Running tasks are
        // requeued without consuming an attempt; failed tasks with attempts left become pending.
        graph_state resume(std::string_view session_id);

        void flush(std::string_view session_id);
        void flush_all();

        // Final flush, closes progress streams and drops the in-memory entry. Without a store
        // the session is gone afterwards.
        void close_session(std::string_view session_id);

        progress_stream subscribe(std::string_view session_id);
        void close_progress(std::string_view session_id);

        bool contains(std::string_view session_id) const;
        std::vector<std::string> sessions() const;

        const state_manager_config& config() const { return cfg_; }
        const std::shared_ptr<snapshot_store>& store() const { return store_; }

      private:
        struct session_entry {
            mutable std::mutex mutex;
            graph_state current;
            std::deque<graph_state> history;
            uint64_t last_persisted_revision{};
            std::chrono::steady_clock::time_point last_persist{};
            std::vector<std::shared_ptr<channel<progress_event>>> subscribers;
        };

        std::shared_ptr<session_entry> find_entry(std::string_view session_id) const;
        std::shared_ptr<session_entry> entry_for(std::string_view session_id) const;
        std::shared_ptr<session_entry> make_entry(graph_state initial) const;
        graph_state archived(std::string_view session_id, std::optional<uint64_t> revision) const;
        bool try_register(const std::shared_ptr<session_entry>& entry);
        void persist(session_entry& entry, const graph_state& state);

        state_manager_config cfg_;
        std::shared_ptr<snapshot_store> store_;

        mutable std::shared_mutex registry_mutex_;
        std::map<std::string, std::shared_ptr<session_entry>, std::less<>> sessions_;
    };

}  // namespace parley
