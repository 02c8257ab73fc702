#include "parley/state_manager.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <algorithm>
#include <variant>

using namespace parley::literals;

namespace parley {
    namespace detail {

        static progress_event make_progress(const graph_state& state, task_id id) {
            const auto& t = state.tasks.at(id);
            return progress_event{
                    .session_id = state.session_id,
                    .task = id,
                    .type = t.type,
                    .status = t.status,
                    .kind = modality_of(t.type),
                    .revision = state.revision};
        }

        static void publish(
                const std::vector<std::shared_ptr<channel<progress_event>>>& subscribers, const progress_event& ev) {
            for (const auto& ch : subscribers) {
                ch->push(ev);
            }
        }

    }  // namespace detail

    state_manager::state_manager(state_manager_config cfg, std::shared_ptr<snapshot_store> store)
            : cfg_{cfg}, store_{std::move(store)} {}

    std::shared_ptr<state_manager::session_entry> state_manager::find_entry(std::string_view session_id) const {
        std::shared_lock lock{registry_mutex_};
        auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    std::shared_ptr<state_manager::session_entry> state_manager::entry_for(std::string_view session_id) const {
        auto entry = find_entry(session_id);
        if (!entry) {
            throw unknown_session_error{session_id};
        }
        return entry;
    }

    bool state_manager::try_register(const std::shared_ptr<session_entry>& entry) {
        std::unique_lock lock{registry_mutex_};
        return sessions_.emplace(entry->current.session_id, entry).second;
    }

    void state_manager::persist(session_entry& entry, const graph_state& state) {
        if (!store_) {
            return;
        }
        store_->put(state);
        std::lock_guard lock{entry.mutex};
        entry.last_persisted_revision = std::max(entry.last_persisted_revision, state.revision);
        entry.last_persist = std::chrono::steady_clock::now();
    }

    std::shared_ptr<state_manager::session_entry> state_manager::make_entry(graph_state initial) const {
        if (initial.session_id.empty()) {
            throw error{"session id must not be empty"};
        }
        initial.revision = 0U;
        initial.context.session_id = initial.session_id;
        initial.feedback = build_report(initial);

        auto entry = std::make_shared<session_entry>();
        entry->current = std::move(initial);
        entry->last_persist = std::chrono::steady_clock::now();
        return entry;
    }

    uint64_t state_manager::create_session(graph_state initial) {
        auto entry = make_entry(std::move(initial));
        auto snapshot_copy = entry->current;
        if (!try_register(entry)) {
            throw error{"session {} is already active"_format(snapshot_copy.session_id)};
        }

        log_debug("created session ", snapshot_copy.session_id);
        persist(*entry, snapshot_copy);
        return 0U;
    }

    uint64_t state_manager::ensure_session(graph_state initial) {
        if (auto existing = find_entry(initial.session_id)) {
            std::lock_guard lock{existing->mutex};
            return existing->current.revision;
        }
        auto entry = make_entry(std::move(initial));
        auto snapshot_copy = entry->current;
        if (!try_register(entry)) {
            return revision(snapshot_copy.session_id);
        }
        persist(*entry, snapshot_copy);
        return 0U;
    }

    uint64_t state_manager::apply(
            std::string_view session_id, const state_mutation& mutation, std::optional<uint64_t> expected_revision) {
        auto entry = entry_for(session_id);

        std::optional<graph_state> to_persist{};
        std::optional<progress_event> event{};
        std::vector<std::shared_ptr<channel<progress_event>>> subscribers{};
        uint64_t committed = 0U;
        {
            std::lock_guard lock{entry->mutex};
            auto& current = entry->current;
            if (expected_revision && *expected_revision != current.revision) {
                throw stale_revision_conflict{
                        "{} on {} expected revision {}, found {}"_format(
                                describe(mutation), session_id, *expected_revision, current.revision),
                        *expected_revision,
                        current.revision};
            }

            auto next = current;
            apply_mutation(next, mutation, now_ms());
            next.revision = current.revision + 1U;
            committed = next.revision;

            entry->history.push_back(std::move(current));
            while (entry->history.size() > cfg_.history_depth) {
                entry->history.pop_front();
            }
            current = std::move(next);

            if (const auto* transition = std::get_if<mutation::transition_task>(&mutation)) {
                event = detail::make_progress(current, transition->id);
                subscribers = entry->subscribers;
            }

            auto due_by_count = committed - entry->last_persisted_revision >= cfg_.persist_every_revisions;
            auto due_by_time = std::chrono::steady_clock::now() - entry->last_persist >= cfg_.persist_interval;
            if (store_ && (due_by_count || due_by_time)) {
                to_persist = current;
            }
        }

        if (event) {
            detail::publish(subscribers, *event);
        }
        if (to_persist) {
            try {
                persist(*entry, *to_persist);
            } catch (const std::exception& e) {
                // the in-memory revision stands; the next cadence point or flush() retries
                log_error("failed to persist ", session_id, '#', committed, ": ", e.what());
            }
        }
        return committed;
    }

    graph_state state_manager::archived(std::string_view session_id, std::optional<uint64_t> revision) const {
        if (!store_ || !store_->latest_revision(session_id)) {
            throw unknown_session_error{session_id};
        }
        auto stored = revision ? store_->get(session_id, *revision) : store_->latest(session_id);
        if (!stored) {
            throw error{"revision {} of {} is not in the store"_format(revision.value_or(0U), session_id)};
        }
        return std::move(*stored);
    }

    graph_state state_manager::snapshot(std::string_view session_id, std::optional<uint64_t> revision) const {
        auto entry = find_entry(session_id);
        if (!entry) {
            return archived(session_id, revision);
        }
        {
            std::lock_guard lock{entry->mutex};
            if (!revision || *revision == entry->current.revision) {
                return entry->current;
            }
            for (const auto& past : entry->history) {
                if (past.revision == *revision) {
                    return past;
                }
            }
            if (*revision > entry->current.revision) {
                throw error{"{} has no revision {} (current {})"_format(session_id, *revision, entry->current.revision)};
            }
        }
        if (store_) {
            if (auto stored = store_->get(session_id, *revision)) {
                return std::move(*stored);
            }
        }
        throw error{"revision {} of {} is no longer retained"_format(*revision, session_id)};
    }

    uint64_t state_manager::revision(std::string_view session_id) const {
        auto entry = entry_for(session_id);
        std::lock_guard lock{entry->mutex};
        return entry->current.revision;
    }

    std::vector<uint64_t> state_manager::history_revisions(std::string_view session_id) const {
        auto entry = entry_for(session_id);
        std::lock_guard lock{entry->mutex};
        std::vector<uint64_t> out{};
        out.reserve(entry->history.size());
        for (const auto& past : entry->history) {
            out.push_back(past.revision);
        }
        return out;
    }

    void state_manager::rollback(std::string_view session_id, uint64_t revision) {
        auto entry = entry_for(session_id);

        std::optional<graph_state> from_store{};
        {
            std::lock_guard lock{entry->mutex};
            if (revision > entry->current.revision) {
                throw error{"cannot roll {} forward to revision {}"_format(session_id, revision)};
            }
            if (revision == entry->current.revision) {
                return;
            }
            auto it = std::ranges::find_if(entry->history, [revision](const graph_state& s) {
                return s.revision == revision;
            });
            if (it != entry->history.end()) {
                entry->current = std::move(*it);
                entry->history.erase(it, entry->history.end());
                from_store = entry->current;
            }
        }

        if (!from_store) {
            if (!store_) {
                throw error{"revision {} of {} is no longer retained"_format(revision, session_id)};
            }
            auto stored = store_->get(session_id, revision);
            if (!stored) {
                throw error{"revision {} of {} is no longer retained"_format(revision, session_id)};
            }
            std::lock_guard lock{entry->mutex};
            entry->current = *stored;
            std::erase_if(entry->history, [revision](const graph_state& s) { return s.revision >= revision; });
            from_store = std::move(stored);
        }

        log_warn("rolled back ", session_id, " to revision ", revision);
        if (store_) {
            store_->truncate_after(session_id, revision);
            {
                std::lock_guard lock{entry->mutex};
                entry->last_persisted_revision = std::min(entry->last_persisted_revision, revision);
            }
            persist(*entry, *from_store);
        }
    }

    graph_state state_manager::resume(std::string_view session_id) {
        if (contains(session_id)) {
            throw error{"session {} is already active"_format(session_id)};
        }
        if (!store_) {
            throw unknown_session_error{session_id};
        }
        auto loaded = store_->latest(session_id);
        if (!loaded) {
            throw unknown_session_error{session_id};
        }

        auto restored = *loaded;
        size_t requeued = 0U;
        for (const auto& [id, t] : loaded->tasks.tasks()) {
            if (t.status == task_status::running) {
                restored.tasks.requeue_interrupted(id);
                ++requeued;
            }
            else if (t.status == task_status::failed && t.attempts_remaining()) {
                restored.tasks.transition(id, task_status::pending, now_ms());
                ++requeued;
            }
        }

        auto entry = std::make_shared<session_entry>();
        entry->last_persisted_revision = loaded->revision;
        entry->last_persist = std::chrono::steady_clock::now();
        if (requeued > 0U) {
            restored.revision = loaded->revision + 1U;
            restored.feedback = build_report(restored);
            entry->history.push_back(std::move(*loaded));
        }
        entry->current = restored;
        if (!try_register(entry)) {
            throw error{"session {} is already active"_format(session_id)};
        }

        log_info("resumed ", session_id, " at revision ", restored.revision, " (", requeued, " tasks requeued)");
        if (requeued > 0U) {
            persist(*entry, restored);
        }
        return restored;
    }

    void state_manager::flush(std::string_view session_id) {
        auto entry = entry_for(session_id);
        if (!store_) {
            return;
        }
        graph_state copy{};
        {
            std::lock_guard lock{entry->mutex};
            if (entry->last_persisted_revision == entry->current.revision) {
                return;
            }
            copy = entry->current;
        }
        persist(*entry, copy);
    }

    void state_manager::flush_all() {
        for (const auto& id : sessions()) {
            flush(id);
        }
    }

    void state_manager::close_session(std::string_view session_id) {
        flush(session_id);
        close_progress(session_id);
        std::unique_lock lock{registry_mutex_};
        if (auto it = sessions_.find(session_id); it != sessions_.end()) {
            sessions_.erase(it);
        }
    }

    progress_stream state_manager::subscribe(std::string_view session_id) {
        auto entry = entry_for(session_id);
        auto ch = std::make_shared<channel<progress_event>>();
        std::lock_guard lock{entry->mutex};
        entry->subscribers.push_back(ch);
        return progress_stream{std::move(ch)};
    }

    void state_manager::close_progress(std::string_view session_id) {
        auto entry = find_entry(session_id);
        if (!entry) {
            return;
        }
        std::vector<std::shared_ptr<channel<progress_event>>> subscribers{};
        {
            std::lock_guard lock{entry->mutex};
            subscribers.swap(entry->subscribers);
        }
        for (const auto& ch : subscribers) {
            ch->close();
        }
    }

    bool state_manager::contains(std::string_view session_id) const {
        return find_entry(session_id) != nullptr;
    }

    std::vector<std::string> state_manager::sessions() const {
        std::shared_lock lock{registry_mutex_};
        std::vector<std::string> out{};
        out.reserve(sessions_.size());
        for (const auto& [id, _] : sessions_) {
            out.push_back(id);
        }
        return out;
    }

}  // namespace parley
