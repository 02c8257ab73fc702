#include "parley/executor.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>

using namespace parley::literals;

namespace parley {

    struct worker_pool::worker_slot {
        std::optional<ticket> running{};
        std::stop_source job_stop{};
        bool retired{false};
    };

    struct worker_pool::shared_state {
        struct live_worker {
            std::shared_ptr<worker_slot> slot;
            std::thread thread;
        };

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::pair<ticket, job>> queue;
        std::vector<live_worker> workers;
        ticket next_ticket{1U};
        bool stopping{false};
    };

    worker_pool::worker_pool(size_t workers) : state_{std::make_shared<shared_state>()} {
        if (workers == 0U) {
            throw invalid_configuration_error{"worker pool needs at least one worker"};
        }
        std::lock_guard lock{state_->mutex};
        for (size_t i = 0U; i < workers; ++i) {
            spawn_locked();
        }
    }

    worker_pool::~worker_pool() {
        std::vector<shared_state::live_worker> workers{};
        {
            std::lock_guard lock{state_->mutex};
            state_->stopping = true;
            for (auto& w : state_->workers) {
                w.slot->job_stop.request_stop();
            }
            workers.swap(state_->workers);
        }
        state_->cv.notify_all();
        for (auto& w : workers) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
        }
    }

    void worker_pool::spawn_locked() {
        auto slot = std::make_shared<worker_slot>();
        std::thread thread{[state = state_, slot] {
            std::unique_lock lock{state->mutex};
            while (true) {
                state->cv.wait(lock, [&] { return state->stopping || slot->retired || !state->queue.empty(); });
                if (state->stopping || slot->retired) {
                    return;
                }

                auto [id, work] = std::move(state->queue.front());
                state->queue.pop_front();
                slot->running = id;
                slot->job_stop = std::stop_source{};
                auto token = slot->job_stop.get_token();
                lock.unlock();

                try {
                    work(token);
                } catch (const std::exception& e) {
                    log_error("pool job ", id, " threw: ", e.what());
                }

                lock.lock();
                slot->running.reset();
                if (slot->retired) {
                    return;
                }
            }
        }};
        state_->workers.push_back(shared_state::live_worker{std::move(slot), std::move(thread)});
    }

    worker_pool::ticket worker_pool::submit(job work) {
        ticket id{};
        {
            std::lock_guard lock{state_->mutex};
            if (state_->stopping) {
                throw error{"worker pool is shutting down"};
            }
            id = state_->next_ticket++;
            state_->queue.emplace_back(id, std::move(work));
        }
        state_->cv.notify_one();
        return id;
    }

    bool worker_pool::abandon(ticket id, bool replace) {
        std::lock_guard lock{state_->mutex};
        auto it = std::ranges::find_if(state_->workers, [id](const shared_state::live_worker& w) {
            return w.slot->running == id;
        });
        if (it == state_->workers.end()) {
            return false;
        }

        it->slot->retired = true;
        it->slot->job_stop.request_stop();
        it->thread.detach();
        state_->workers.erase(it);
        abandoned_.fetch_add(1U, std::memory_order_relaxed);

        if (replace && !state_->stopping) {
            spawn_locked();
        }
        return true;
    }

    size_t worker_pool::size() const {
        std::lock_guard lock{state_->mutex};
        return state_->workers.size();
    }

    namespace detail {

        using steady = std::chrono::steady_clock;

        // A default-constructed outcome (task 0) is only a wake-up for the executor loop.
        struct attempt_outcome {
            task_id task{};
            uint32_t attempt{};
            std::expected<result_ref, analyzer_error> value{};
        };

        struct in_flight {
            worker_pool::ticket ticket{};
            uint32_t attempt{};
            task_type type{task_type::content_analysis};
            steady::time_point started{};
            steady::time_point deadline{};
        };

        // Owned by the job, so an abandoned worker never reads executor state.
        struct job_context {
            std::string session_id;
            task_id task{};
            modality kind{modality::content};
            uint32_t attempt{};
            std::string job_position;
            modality_input input;
            param_map params;
            steady::time_point deadline{};
        };

        static worker_pool::job make_analysis_job(
                std::shared_ptr<const job_context> ctx,
                capability_ptr capability,
                std::shared_ptr<channel<attempt_outcome>> results) {
            return [ctx = std::move(ctx), capability = std::move(capability), results = std::move(results)](
                           std::stop_token token) {
                analysis_outcome outcome{};
                try {
                    capability_request request{
                            .task = ctx->task,
                            .kind = ctx->kind,
                            .attempt = ctx->attempt,
                            .job_position = ctx->job_position,
                            .input = ctx->input,
                            .params = ctx->params,
                            .deadline = deadline_context{ctx->deadline, token}};
                    outcome = capability->analyze(request);
                } catch (const std::exception& e) {
                    outcome = std::unexpected(analyzer_error{
                            analyzer_errc::transient_provider_error, "analyzer threw: {}"_format(e.what())});
                }

                attempt_outcome out{ctx->task, ctx->attempt, {}};
                if (outcome) {
                    auto result = std::make_shared<analysis_result>(std::move(*outcome));
                    result->source_task = ctx->task;
                    result->kind = ctx->kind;
                    out.value = result_ref{std::move(result)};
                }
                else {
                    out.value = std::unexpected(outcome.error());
                }
                results->push(std::move(out));
            };
        }

        // Integration needs at least one modality result; feedback is derived from the state itself.
        static worker_pool::job make_stage_job(
                std::shared_ptr<const graph_state> snapshot,
                task_id task,
                task_type type,
                uint32_t attempt,
                std::shared_ptr<channel<attempt_outcome>> results) {
            return [snapshot = std::move(snapshot), task, type, attempt, results = std::move(results)](
                           std::stop_token token) {
                attempt_outcome out{task, attempt, result_ref{}};
                if (token.stop_requested()) {
                    out.value = std::unexpected(analyzer_error{analyzer_errc::cancelled, "stop requested"});
                }
                else if (type == task_type::integration && snapshot->analysis.results.empty()) {
                    out.value = std::unexpected(
                            analyzer_error{analyzer_errc::input_unavailable, "no modality produced a result"});
                }
                results->push(std::move(out));
            };
        }

    }  // namespace detail

    parallel_executor::parallel_executor(state_manager& state, capability_set capabilities, executor_config cfg)
            : state_{state}, capabilities_{std::move(capabilities)}, cfg_{cfg} {
        if (cfg_.workers == 0U) {
            throw invalid_configuration_error{"executor needs at least one worker"};
        }
    }

    execution_summary parallel_executor::run(std::string_view session_id, std::stop_token stop) {
        using detail::steady;

        const std::string id{session_id};
        execution_summary summary{};
        auto results = std::make_shared<channel<detail::attempt_outcome>>();
        std::stop_callback wake{stop, [results] { results->push(detail::attempt_outcome{}); }};
        std::map<task_id, detail::in_flight> inflight{};
        worker_pool pool{cfg_.workers};

        // Tasks can only be moved by this loop, or cancelled by a rollback from outside; a refused
        // mutation means the task is no longer ours to drive.
        auto apply = [&](state_mutation m) -> bool {
            try {
                state_.apply(id, m);
                return true;
            } catch (const invalid_transition_error& e) {
                log_warn(id, ": ", describe(m), " refused: ", e.what());
            } catch (const stale_revision_conflict& e) {
                log_warn(id, ": ", describe(m), " conflicted: ", e.what());
            }
            return false;
        };

        auto settle_failure = [&](task_id tid, task_type type, uint32_t attempt, const analyzer_error& err) {
            auto message = err.describe();
            if (err.code == analyzer_errc::input_unavailable) {
                if (is_modality_task(type)) {
                    apply(mutation::transition_task{.id = tid, .to = task_status::skipped, .error = message});
                }
                else {
                    apply(mutation::transition_task{
                            .id = tid, .to = task_status::failed, .error = message, .permanent = true});
                }
                return;
            }
            if (err.code == analyzer_errc::invalid_params) {
                apply(mutation::transition_task{
                        .id = tid, .to = task_status::failed, .error = message, .permanent = true});
                return;
            }
            if (err.code == analyzer_errc::cancelled && stop.stop_requested()) {
                apply(mutation::transition_task{.id = tid, .to = task_status::cancelled, .error = message});
                return;
            }

            if (!apply(mutation::transition_task{.id = tid, .to = task_status::failed, .error = message})) {
                return;
            }
            auto after = state_.snapshot(id);
            if (!after.tasks.at(tid).attempts_remaining()) {
                log_warn(id, ": task ", tid, " (", type, ") gave up after ", attempt, " attempts: ", message);
                return;
            }
            auto delay = cfg_.backoff_for(attempt);
            log_info(id, ": task ", tid, " attempt ", attempt, " failed (", message, "), retry in ", delay.count(), "ms");
            apply(mutation::transition_task{.id = tid, .to = task_status::pending, .eligible_at = now_ms() + delay});
        };

        auto dispatch = [&](const graph_state& snap, task_id tid) {
            const auto& t = snap.tasks.at(tid);
            auto kind = modality_of(t.type);

            capability_ptr capability{};
            const modality_input* input = nullptr;
            if (kind) {
                input = snap.inputs.input_for(*kind);
                capability = capabilities_.get(*kind);
                if (input == nullptr || !capability) {
                    auto reason = input == nullptr ? "no {} input"_format(*kind) : "no {} analyzer"_format(*kind);
                    apply(mutation::transition_task{.id = tid, .to = task_status::skipped, .error = reason});
                    return;
                }
            }

            if (!apply(mutation::transition_task{.id = tid, .to = task_status::running})) {
                return;
            }
            auto attempt = t.attempt_count + 1U;
            auto started = steady::now();
            auto deadline = started + cfg_.task_timeout;

            worker_pool::job work{};
            if (kind) {
                auto ctx = std::make_shared<detail::job_context>(detail::job_context{
                        .session_id = id,
                        .task = tid,
                        .kind = *kind,
                        .attempt = attempt,
                        .job_position = snap.context.job_position,
                        .input = *input,
                        .params = t.input_params,
                        .deadline = deadline});
                work = detail::make_analysis_job(std::move(ctx), std::move(capability), results);
            }
            else {
                work = detail::make_stage_job(std::make_shared<const graph_state>(snap), tid, t.type, attempt, results);
            }

            log_debug(id, ": dispatch task ", tid, " (", t.type, ") attempt ", attempt);
            auto ticket = pool.submit(std::move(work));
            inflight.emplace(tid, detail::in_flight{ticket, attempt, t.type, started, deadline});
        };

        auto handle = [&](detail::attempt_outcome outcome) {
            auto it = inflight.find(outcome.task);
            if (it == inflight.end() || it->second.attempt != outcome.attempt) {
                if (outcome.task != 0U) {
                    log_debug(id, ": discarding late outcome of task ", outcome.task, " attempt ", outcome.attempt);
                }
                return;
            }
            auto flight = it->second;
            inflight.erase(it);

            attempt_record record{
                    .task = outcome.task,
                    .type = flight.type,
                    .attempt = flight.attempt,
                    .latency = std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - flight.started)};

            if (outcome.value) {
                const auto& result = *outcome.value;
                if (result) {
                    record.confidence = result->confidence;
                    if (!apply(mutation::record_result{result})) {
                        summary.attempts.push_back(record);
                        return;
                    }
                }
                apply(mutation::transition_task{.id = outcome.task, .to = task_status::succeeded});
            }
            else {
                record.failure = outcome.value.error().code;
                settle_failure(outcome.task, flight.type, flight.attempt, outcome.value.error());
            }
            summary.attempts.push_back(record);
        };

        auto expire_deadlines = [&] {
            auto now = steady::now();
            for (auto it = inflight.begin(); it != inflight.end();) {
                if (it->second.deadline > now) {
                    ++it;
                    continue;
                }
                auto tid = it->first;
                auto flight = it->second;
                it = inflight.erase(it);

                pool.abandon(flight.ticket, true);
                log_warn(id, ": task ", tid, " missed its ", cfg_.task_timeout.count(), "ms deadline, worker abandoned");
                summary.attempts.push_back(attempt_record{
                        .task = tid,
                        .type = flight.type,
                        .attempt = flight.attempt,
                        .latency = cfg_.task_timeout,
                        .failure = analyzer_errc::deadline_exceeded});
                settle_failure(
                        tid,
                        flight.type,
                        flight.attempt,
                        analyzer_error{
                                analyzer_errc::deadline_exceeded,
                                "no result within {}ms"_format(cfg_.task_timeout.count())});
            }
        };

        auto cancel_remaining = [&] {
            for (const auto& [tid, flight] : inflight) {
                pool.abandon(flight.ticket, false);
            }
            inflight.clear();

            auto snap = state_.snapshot(id);
            for (const auto& [tid, t] : snap.tasks.tasks()) {
                if (t.is_terminal()) {
                    continue;
                }
                if (t.status == task_status::failed) {
                    apply(mutation::transition_task{.id = tid, .to = task_status::pending});
                }
                apply(mutation::transition_task{.id = tid, .to = task_status::cancelled, .error = "session cancelled"});
            }
            summary.cancelled = true;
            log_info(id, ": cancelled");
        };

        while (true) {
            if (stop.stop_requested()) {
                cancel_remaining();
                break;
            }

            auto snap = state_.snapshot(id);

            bool changed = false;
            for (auto blocked : snap.tasks.blocked_tasks()) {
                changed |= apply(mutation::transition_task{
                        .id = blocked, .to = task_status::skipped, .error = "a required dependency did not succeed"});
            }
            if (changed) {
                continue;
            }

            if (inflight.empty() && snap.tasks.all_terminal()) {
                break;
            }

            auto wall_now = now_ms();
            auto ready = snap.tasks.ready_tasks(wall_now);
            for (auto tid : ready) {
                if (inflight.size() >= cfg_.workers) {
                    break;
                }
                dispatch(snap, tid);
            }

            if (inflight.empty() && !ready.empty()) {
                // everything ready was settled without dispatch
                continue;
            }

            auto next_eligible = snap.tasks.next_eligible_at();
            auto backing_off = next_eligible && *next_eligible > wall_now;
            if (inflight.empty() && ready.empty() && !backing_off) {
                // nothing runs, nothing becomes eligible: what is left can never start
                bool settled = false;
                for (const auto& [tid, t] : snap.tasks.tasks()) {
                    if (t.is_terminal() || t.status == task_status::running) {
                        continue;
                    }
                    if (t.status == task_status::failed) {
                        apply(mutation::transition_task{.id = tid, .to = task_status::pending});
                    }
                    settled |= apply(mutation::transition_task{
                            .id = tid, .to = task_status::skipped, .error = "dependencies can never be satisfied"});
                }
                if (!settled) {
                    log_error(id, ": executor stalled with no runnable task");
                    break;
                }
                continue;
            }

            auto wake_at = steady::now() + std::chrono::milliseconds{250};
            for (const auto& [_, flight] : inflight) {
                wake_at = std::min(wake_at, flight.deadline);
            }
            if (backing_off) {
                wake_at = std::min(wake_at, steady::now() + (*next_eligible - wall_now));
            }

            if (auto outcome = results->pop_until(wake_at)) {
                handle(std::move(*outcome));
                while (auto more = results->try_pop()) {
                    handle(std::move(*more));
                }
            }
            expire_deadlines();
        }

        results->close();
        summary.abandoned_workers = pool.abandoned_count();
        summary.report = state_.snapshot(id).feedback;
        return summary;
    }

}  // namespace parley
