#pragma once

#include "task.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace parley {

    struct planned_task {
        task value{};
        std::vector<task_id> dependencies{};
    };

    // Per-session task set plus dependency adjacency. Always acyclic.
    class task_graph {
      public:
        // Inserts one task. Dependencies may reference tasks that are not yet present.
        void add(task value, std::vector<task_id> dependencies = {});

        // Inserts a batch atomically: on cyclic_dependency_error (or a duplicate id)
        // the graph is left untouched.
        void add(std::vector<planned_task> batch);

        const task& at(task_id id) const;
        const task* find(task_id id) const;
        bool contains(task_id id) const { return tasks_.contains(id); }
        size_t size() const { return tasks_.size(); }
        bool empty() const { return tasks_.empty(); }

        const std::map<task_id, task>& tasks() const { return tasks_; }
        const std::vector<task_id>& dependencies(task_id id) const;
        std::vector<task_id> dependents(task_id id) const;
        std::vector<const task*> tasks_of(task_type type) const;

        // Pending tasks whose dependencies are satisfied and whose backoff has elapsed,
        // ordered critical > high > normal > low, then by creation order.
        std::vector<task_id> ready_tasks(timestamp now = now_ms()) const;

        // Pending tasks that can never run because a required dependency ended without success.
        std::vector<task_id> blocked_tasks() const;

        std::optional<timestamp> next_eligible_at() const;
        bool all_terminal() const;
        size_t count(task_status status) const;

        // Validates the edge and records its side effects (timestamps, attempts, error).
        // A permanent failure gives up the remaining attempts, making the task terminal.
        const task& transition(
                task_id id,
                task_status to,
                timestamp at,
                std::optional<std::string> error = std::nullopt,
                std::optional<timestamp> eligible_at = std::nullopt,
                bool permanent = false);

        // Recovery edge used on resume: a task caught Running by a crash returns to Pending
        // and gets back the attempt it never finished.
        void requeue_interrupted(task_id id);

        uint64_t next_sequence() const { return next_sequence_; }

        // Rebuilds a graph from persisted tasks, keeping their recorded sequence numbers.
        static task_graph restore(std::vector<planned_task> entries, uint64_t next_sequence);

        bool operator==(const task_graph&) const = default;

      private:
        bool dependency_satisfied(const task& dependent, task_id dependency) const;

        std::map<task_id, task> tasks_{};
        std::map<task_id, std::vector<task_id>> dependencies_{};
        uint64_t next_sequence_{1U};
    };

}  // namespace parley
