#include "parley/task_graph.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

using namespace parley::literals;

namespace parley {
    namespace detail {

        using adjacency = std::map<task_id, std::vector<task_id>>;

        enum class visit_mark : uint8_t { unvisited, in_progress, done };

        // Iterative DFS; returns the node that closes a cycle reachable from root, if any.
        static std::optional<task_id> find_cycle_from(
                task_id root, const adjacency& edges, std::unordered_map<task_id, visit_mark>& marks) {
            struct frame {
                task_id node;
                size_t next_edge;
            };

            if (marks[root] == visit_mark::done) {
                return std::nullopt;
            }

            std::vector<frame> stack{{root, 0U}};
            marks[root] = visit_mark::in_progress;

            while (!stack.empty()) {
                auto& top = stack.back();
                auto it = edges.find(top.node);
                if (it == edges.end() || top.next_edge >= it->second.size()) {
                    marks[top.node] = visit_mark::done;
                    stack.pop_back();
                    continue;
                }

                auto next = it->second[top.next_edge++];
                auto& mark = marks[next];
                if (mark == visit_mark::in_progress) {
                    return next;
                }
                if (mark == visit_mark::unvisited) {
                    mark = visit_mark::in_progress;
                    stack.push_back({next, 0U});
                }
            }
            return std::nullopt;
        }

        static constexpr int priority_rank(task_priority priority) {
            switch (priority) {
                case task_priority::critical:
                    return 3;
                case task_priority::high:
                    return 2;
                case task_priority::normal:
                    return 1;
                case task_priority::low:
                    return 0;
            }
            return 1;
        }

    }  // namespace detail

    void task_graph::add(task value, std::vector<task_id> dependencies) {
        std::vector<planned_task> batch{};
        batch.push_back(planned_task{std::move(value), std::move(dependencies)});
        add(std::move(batch));
    }

    void task_graph::add(std::vector<planned_task> batch) {
        std::set<task_id> incoming{};
        for (const auto& entry : batch) {
            if (tasks_.contains(entry.value.id) || !incoming.insert(entry.value.id).second) {
                throw error{"duplicate task id {}"_format(entry.value.id)};
            }
            if (std::ranges::find(entry.dependencies, entry.value.id) != entry.dependencies.end()) {
                throw cyclic_dependency_error{"task {} depends on itself"_format(entry.value.id)};
            }
        }

        auto candidate = dependencies_;
        for (const auto& entry : batch) {
            candidate[entry.value.id] = entry.dependencies;
        }

        // Every new edge starts at a new node, so any new cycle is reachable from one of them.
        std::unordered_map<task_id, detail::visit_mark> marks{};
        for (const auto& entry : batch) {
            if (auto closing = detail::find_cycle_from(entry.value.id, candidate, marks)) {
                throw cyclic_dependency_error{
                        "adding task {} would create a dependency cycle through task {}"_format(
                                entry.value.id, *closing)};
            }
        }

        dependencies_ = std::move(candidate);
        for (auto& entry : batch) {
            auto value = std::move(entry.value);
            value.sequence = next_sequence_++;
            auto id = value.id;
            tasks_.emplace(id, std::move(value));
        }
    }

    task_graph task_graph::restore(std::vector<planned_task> entries, uint64_t next_sequence) {
        task_graph graph{};
        for (auto& entry : entries) {
            graph.dependencies_[entry.value.id] = std::move(entry.dependencies);
        }

        std::unordered_map<task_id, detail::visit_mark> marks{};
        for (const auto& [id, _] : graph.dependencies_) {
            if (auto closing = detail::find_cycle_from(id, graph.dependencies_, marks)) {
                throw cyclic_dependency_error{"restored task graph contains a cycle through task {}"_format(*closing)};
            }
        }

        uint64_t highest = 0U;
        for (auto& entry : entries) {
            highest = std::max(highest, entry.value.sequence);
            auto id = entry.value.id;
            graph.tasks_.emplace(id, std::move(entry.value));
        }
        graph.next_sequence_ = std::max(next_sequence, highest + 1U);
        return graph;
    }

    const task& task_graph::at(task_id id) const {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            throw error{"unknown task id {}"_format(id)};
        }
        return it->second;
    }

    const task* task_graph::find(task_id id) const {
        auto it = tasks_.find(id);
        return it == tasks_.end() ? nullptr : &it->second;
    }

    const std::vector<task_id>& task_graph::dependencies(task_id id) const {
        static const std::vector<task_id> none{};
        auto it = dependencies_.find(id);
        return it == dependencies_.end() ? none : it->second;
    }

    std::vector<task_id> task_graph::dependents(task_id id) const {
        std::vector<task_id> out{};
        for (const auto& [candidate, deps] : dependencies_) {
            if (std::ranges::find(deps, id) != deps.end()) {
                out.push_back(candidate);
            }
        }
        return out;
    }

    std::vector<const task*> task_graph::tasks_of(task_type type) const {
        std::vector<const task*> out{};
        for (const auto& [_, value] : tasks_) {
            if (value.type == type) {
                out.push_back(&value);
            }
        }
        return out;
    }

    bool task_graph::dependency_satisfied(const task& dependent, task_id dependency) const {
        const auto* dep = find(dependency);
        if (dep == nullptr) {
            return false;
        }
        if (dep->status == task_status::succeeded) {
            return true;
        }
        return dependent.best_effort && dep->is_terminal();
    }

    std::vector<task_id> task_graph::ready_tasks(timestamp now) const {
        std::vector<const task*> ready{};
        for (const auto& [id, value] : tasks_) {
            if (value.status != task_status::pending) {
                continue;
            }
            if (value.eligible_at && *value.eligible_at > now) {
                continue;
            }
            const auto& deps = dependencies(id);
            if (std::ranges::all_of(deps, [&](task_id dep) { return dependency_satisfied(value, dep); })) {
                ready.push_back(&value);
            }
        }

        std::ranges::sort(ready, [](const task* lhs, const task* rhs) {
            auto lrank = detail::priority_rank(lhs->priority);
            auto rrank = detail::priority_rank(rhs->priority);
            if (lrank != rrank) {
                return lrank > rrank;
            }
            return lhs->sequence < rhs->sequence;
        });

        std::vector<task_id> out{};
        out.reserve(ready.size());
        for (const auto* value : ready) {
            out.push_back(value->id);
        }
        return out;
    }

    std::vector<task_id> task_graph::blocked_tasks() const {
        std::vector<task_id> out{};
        for (const auto& [id, value] : tasks_) {
            if (value.status != task_status::pending || value.best_effort) {
                continue;
            }
            for (auto dep_id : dependencies(id)) {
                const auto* dep = find(dep_id);
                if (dep != nullptr && dep->is_terminal() && dep->status != task_status::succeeded) {
                    out.push_back(id);
                    break;
                }
            }
        }
        return out;
    }

    std::optional<timestamp> task_graph::next_eligible_at() const {
        std::optional<timestamp> earliest{};
        for (const auto& [_, value] : tasks_) {
            if (value.status != task_status::pending || !value.eligible_at) {
                continue;
            }
            if (!earliest || *value.eligible_at < *earliest) {
                earliest = value.eligible_at;
            }
        }
        return earliest;
    }

    bool task_graph::all_terminal() const {
        return std::ranges::all_of(tasks_, [](const auto& entry) { return entry.second.is_terminal(); });
    }

    size_t task_graph::count(task_status status) const {
        return static_cast<size_t>(
                std::ranges::count_if(tasks_, [status](const auto& entry) { return entry.second.status == status; }));
    }

    const task& task_graph::transition(
            task_id id,
            task_status to,
            timestamp at,
            std::optional<std::string> error,
            std::optional<timestamp> eligible_at,
            bool permanent) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            throw parley::error{"unknown task id {}"_format(id)};
        }
        auto& value = it->second;

        if (!is_legal_transition(value.status, to)) {
            throw invalid_transition_error{
                    "illegal transition for task {}: {} -> {}"_format(id, value.status, to)};
        }
        if (value.status == task_status::failed && to == task_status::pending && !value.attempts_remaining()) {
            throw invalid_transition_error{
                    "task {} exhausted {} attempts and cannot be retried"_format(id, value.max_attempts)};
        }

        switch (to) {
            case task_status::running:
                ++value.attempt_count;
                value.started_at = at;
                value.finished_at.reset();
                value.eligible_at.reset();
                break;
            case task_status::pending:
                value.eligible_at = eligible_at;
                value.finished_at.reset();
                break;
            case task_status::failed:
                value.finished_at = at;
                value.last_error = error ? std::move(error) : std::optional<std::string>{"unspecified failure"};
                if (permanent) {
                    value.max_attempts = value.attempt_count;
                }
                break;
            case task_status::skipped:
            case task_status::cancelled:
                value.finished_at = at;
                if (error) {
                    value.last_error = std::move(error);
                }
                break;
            case task_status::succeeded:
                value.finished_at = at;
                break;
        }
        value.status = to;
        return value;
    }

    void task_graph::requeue_interrupted(task_id id) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            throw parley::error{"unknown task id {}"_format(id)};
        }
        auto& value = it->second;
        if (value.status != task_status::running) {
            throw invalid_transition_error{"task {} is {}, not running"_format(id, value.status)};
        }
        if (value.attempt_count > 0U) {
            --value.attempt_count;
        }
        value.status = task_status::pending;
        value.started_at.reset();
        value.eligible_at.reset();
    }

}  // namespace parley
