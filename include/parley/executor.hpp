#pragma once

#include "capability.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "state_manager.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace parley {

    /*
     * Fixed-size pool whose workers can be written off.
     *
     * abandon() signals the stop token of the job a worker is running, detaches that
     * worker's thread and (optionally) starts a fresh worker in its place, so a job that
     * never returns costs one thread instead of one pool slot. Detached workers only touch
     * state they co-own through shared_ptr, never the pool object.
     */
    class worker_pool {
      public:
        using ticket = uint64_t;
        using job = std::function<void(std::stop_token)>;

        explicit worker_pool(size_t workers);
        ~worker_pool();

        worker_pool(const worker_pool&) = delete;
        worker_pool& operator=(const worker_pool&) = delete;

        ticket submit(job work);

        // Returns false when the ticket is not running (finished, or still queued).
        bool abandon(ticket id, bool replace = true);

        size_t size() const;
        size_t abandoned_count() const { return abandoned_.load(std::memory_order_relaxed); }

      private:
        struct shared_state;
        struct worker_slot;

        void spawn_locked();

        std::shared_ptr<shared_state> state_;
        std::atomic<size_t> abandoned_{0U};
    };

    // One finished (or given-up) analyzer attempt, as seen by the executor loop.
    struct attempt_record {
        task_id task{};
        task_type type{task_type::content_analysis};
        uint32_t attempt{};
        std::chrono::milliseconds latency{};
        std::optional<double> confidence{};
        std::optional<analyzer_errc> failure{};
    };

    struct execution_summary {
        session_report report{};
        std::vector<attempt_record> attempts{};
        size_t abandoned_workers{};
        bool cancelled{false};
    };

    /*
     * Drives one session to completion. The loop thread is the only code that transitions
     * the session's tasks; workers hand their outcomes back over a channel.
     *
     *  - ready tasks go out in priority order while fewer than `workers` are in flight
     *  - transient failures and deadline misses retry after min(base * 2^attempts, cap)
     *  - input_unavailable skips the task, invalid_params fails it for good
     *  - pending tasks whose required dependencies ended without success are skipped
     *  - a worker past its deadline is abandoned and replaced, its late result discarded
     */
    class parallel_executor {
      public:
        parallel_executor(state_manager& state, capability_set capabilities, executor_config cfg = {});

        // Returns when every task is terminal, or after stop is requested and the remaining
        // tasks were cancelled.
        execution_summary run(std::string_view session_id, std::stop_token stop = {});

        const executor_config& config() const { return cfg_; }

      private:
        state_manager& state_;
        capability_set capabilities_;
        executor_config cfg_;
    };

}  // namespace parley
