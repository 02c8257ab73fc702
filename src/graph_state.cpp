#include "parley/graph_state.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <type_traits>

using namespace parley::literals;

namespace parley {
    namespace detail {

        template <typename... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        static void apply_one(graph_state& state, const mutation::add_task& m, timestamp at) {
            auto value = m.value;
            if (value.created_at == timestamp{}) {
                value.created_at = at;
            }
            state.tasks.add(std::move(value), m.dependencies);
        }

        static void apply_one(graph_state& state, const mutation::add_tasks& m, timestamp at) {
            auto batch = m.batch;
            for (auto& entry : batch) {
                if (entry.value.created_at == timestamp{}) {
                    entry.value.created_at = at;
                }
            }
            state.tasks.add(std::move(batch));
        }

        static void apply_one(graph_state& state, const mutation::transition_task& m, timestamp at) {
            const auto& current = state.tasks.at(m.id);
            if (current.status == m.to && current.is_terminal()) {
                throw stale_revision_conflict{
                        "task {} is already {}"_format(m.id, m.to), state.revision, state.revision};
            }
            state.tasks.transition(m.id, m.to, at, m.error, m.eligible_at, m.permanent);
        }

        static void apply_one(graph_state& state, const mutation::record_result& m, timestamp) {
            if (!m.result) {
                throw error{"record_result without a result"};
            }
            const auto& source = state.tasks.at(m.result->source_task);
            if (source.status == task_status::succeeded) {
                throw stale_revision_conflict{
                        "result for task {} was already recorded"_format(source.id), state.revision, state.revision};
            }
            if (modality_of(source.type) != m.result->kind) {
                throw error{"task {} ({}) cannot produce a {} result"_format(source.id, source.type, m.result->kind)};
            }
            state.analysis.record(m.result);
        }

        static void apply_one(graph_state& state, const mutation::adjust_params& m, timestamp) {
            for (const auto& [name, delta] : m.deltas) {
                auto it = state.parameters.find(name);
                if (it == state.parameters.end()) {
                    throw error{"unknown parameter: {}"_format(name)};
                }
                auto next = it->second + delta;
                if (auto b = state.bounds.find(name); b != state.bounds.end()) {
                    next = b->second.clamp(next);
                }
                it->second = next;
            }
        }

        static void apply_one(graph_state& state, const mutation::configure_params& m, timestamp) {
            for (const auto& [name, b] : m.bounds) {
                if (b.min > b.max) {
                    throw error{"bounds of {}: min {} exceeds max {}"_format(name, b.min, b.max)};
                }
            }
            state.bounds = m.bounds;
            for (const auto& [name, value] : m.parameters) {
                if (m.reset) {
                    state.parameters.insert_or_assign(name, value);
                }
                else {
                    state.parameters.try_emplace(name, value);
                }
            }
            for (auto& [name, value] : state.parameters) {
                if (auto b = state.bounds.find(name); b != state.bounds.end()) {
                    value = b->second.clamp(value);
                }
            }
        }

    }  // namespace detail

    std::string_view describe(const state_mutation& m) {
        return std::visit(
                detail::overloaded{
                        [](const mutation::add_task&) { return "add_task"sv; },
                        [](const mutation::add_tasks&) { return "add_tasks"sv; },
                        [](const mutation::transition_task&) { return "transition_task"sv; },
                        [](const mutation::record_result&) { return "record_result"sv; },
                        [](const mutation::adjust_params&) { return "adjust_params"sv; },
                        [](const mutation::configure_params&) { return "configure_params"sv; }},
                m);
    }

    void apply_mutation(graph_state& state, const state_mutation& m, timestamp at) {
        std::visit([&](const auto& concrete) { detail::apply_one(state, concrete, at); }, m);
        state.feedback = build_report(state);
    }

}  // namespace parley
