#include "utils.hpp"

namespace parley::test {
    using namespace std::string_view_literals;

    namespace detail {
        static task make_task(task_id id, task_priority priority, task_type type = task_type::content_analysis) {
            task t{};
            t.id = id;
            t.type = type;
            t.priority = priority;
            return t;
        }
    }  // namespace detail

    TEST_CASE("002: ready tasks order by priority then creation", "[002][task_graph]") {
        task_graph graph{};
        graph.add(detail::make_task(1U, task_priority::normal));    // A
        graph.add(detail::make_task(2U, task_priority::critical));  // B
        graph.add(detail::make_task(3U, task_priority::normal));    // C

        CHECK(graph.ready_tasks() == std::vector<task_id>{2U, 1U, 3U});

        graph.add(detail::make_task(4U, task_priority::high));
        graph.add(detail::make_task(5U, task_priority::low));
        CHECK(graph.ready_tasks() == std::vector<task_id>{2U, 4U, 1U, 3U, 5U});
    }

    TEST_CASE("002: dependencies gate readiness", "[002][task_graph]") {
        task_graph graph{};
        graph.add(std::vector<planned_task>{
                {detail::make_task(1U, task_priority::normal), {}},
                {detail::make_task(2U, task_priority::critical, task_type::integration), {1U}},
        });

        CHECK(graph.ready_tasks() == std::vector<task_id>{1U});
        CHECK(graph.dependents(1U) == std::vector<task_id>{2U});

        auto t0 = now_ms();
        graph.transition(1U, task_status::running, t0);
        CHECK(graph.ready_tasks().empty());
        graph.transition(1U, task_status::succeeded, t0);
        CHECK(graph.ready_tasks() == std::vector<task_id>{2U});
    }

    TEST_CASE("002: cyclic inserts are rejected without partial insertion", "[002][task_graph]") {
        task_graph graph{};
        graph.add(detail::make_task(1U, task_priority::normal), {2U});

        std::vector<planned_task> batch{
                {detail::make_task(2U, task_priority::normal), {3U}},
                {detail::make_task(3U, task_priority::normal), {1U}},
        };
        CHECK_THROWS_AS(graph.add(batch), cyclic_dependency_error);
        CHECK(graph.size() == 1U);
        CHECK_FALSE(graph.contains(2U));
        CHECK_FALSE(graph.contains(3U));

        CHECK_THROWS_AS(graph.add(detail::make_task(9U, task_priority::low), {9U}), cyclic_dependency_error);
        CHECK_THROWS_AS(graph.add(detail::make_task(1U, task_priority::low)), error);
        CHECK(graph.size() == 1U);

        // the same tasks without the back edge are fine
        batch.back().dependencies.clear();
        graph.add(batch);
        CHECK(graph.size() == 3U);
    }

    TEST_CASE("002: illegal transitions are refused", "[002][task_graph]") {
        task_graph graph{};
        graph.add(detail::make_task(1U, task_priority::normal));
        auto t0 = now_ms();

        CHECK_THROWS_AS(graph.transition(1U, task_status::succeeded, t0), invalid_transition_error);
        CHECK_THROWS_AS(graph.transition(1U, task_status::failed, t0), invalid_transition_error);

        graph.transition(1U, task_status::running, t0);
        graph.transition(1U, task_status::succeeded, t0);
        CHECK_THROWS_AS(graph.transition(1U, task_status::pending, t0), invalid_transition_error);
        CHECK_THROWS_AS(graph.transition(1U, task_status::cancelled, t0), invalid_transition_error);
        CHECK_THROWS_AS(graph.transition(42U, task_status::running, t0), error);
    }

    TEST_CASE("002: retries stop at max_attempts", "[002][task_graph]") {
        task_graph graph{};
        auto t = detail::make_task(1U, task_priority::normal);
        t.max_attempts = 2U;
        graph.add(t);
        auto t0 = now_ms();

        graph.transition(1U, task_status::running, t0);
        graph.transition(1U, task_status::failed, t0, "boom");
        CHECK_FALSE(graph.at(1U).is_terminal());
        CHECK(graph.at(1U).last_error == "boom");

        graph.transition(1U, task_status::pending, t0, std::nullopt, t0 + std::chrono::milliseconds{50});
        CHECK(graph.ready_tasks(t0).empty());
        CHECK(graph.next_eligible_at() == t0 + std::chrono::milliseconds{50});
        CHECK(graph.ready_tasks(t0 + std::chrono::milliseconds{50}) == std::vector<task_id>{1U});

        graph.transition(1U, task_status::running, t0);
        graph.transition(1U, task_status::failed, t0, "boom again");
        CHECK(graph.at(1U).attempt_count == 2U);
        CHECK(graph.at(1U).is_terminal());
        CHECK(graph.all_terminal());
        CHECK_THROWS_AS(graph.transition(1U, task_status::pending, t0), invalid_transition_error);
    }

    TEST_CASE("002: permanent failure gives up remaining attempts", "[002][task_graph]") {
        task_graph graph{};
        graph.add(detail::make_task(1U, task_priority::normal));
        auto t0 = now_ms();

        graph.transition(1U, task_status::running, t0);
        graph.transition(1U, task_status::failed, t0, "invalid_params", std::nullopt, true);
        CHECK(graph.at(1U).is_terminal());
        CHECK(graph.at(1U).max_attempts == 1U);
    }

    TEST_CASE("002: blocked and best effort dependents", "[002][task_graph]") {
        task_graph graph{};
        auto integration = detail::make_task(3U, task_priority::critical, task_type::integration);
        integration.best_effort = true;
        auto t = detail::make_task(1U, task_priority::normal);
        t.max_attempts = 1U;
        graph.add(std::vector<planned_task>{
                {t, {}},
                {detail::make_task(2U, task_priority::normal, task_type::speech_analysis), {1U}},
                {integration, {1U}},
        });
        auto t0 = now_ms();

        graph.transition(1U, task_status::running, t0);
        graph.transition(1U, task_status::failed, t0, "gone");

        CHECK(graph.blocked_tasks() == std::vector<task_id>{2U});
        CHECK(graph.ready_tasks() == std::vector<task_id>{3U});
    }

    TEST_CASE("002: interrupted tasks requeue without spending an attempt", "[002][task_graph]") {
        task_graph graph{};
        graph.add(detail::make_task(1U, task_priority::normal));
        auto t0 = now_ms();

        graph.transition(1U, task_status::running, t0);
        REQUIRE(graph.at(1U).attempt_count == 1U);

        graph.requeue_interrupted(1U);
        CHECK(graph.at(1U).status == task_status::pending);
        CHECK(graph.at(1U).attempt_count == 0U);
        CHECK_FALSE(graph.at(1U).started_at.has_value());
        CHECK_THROWS_AS(graph.requeue_interrupted(1U), invalid_transition_error);
    }

    TEST_CASE("002: restore keeps sequence order", "[002][task_graph]") {
        task_graph graph{};
        graph.add(detail::make_task(1U, task_priority::normal));
        graph.add(detail::make_task(2U, task_priority::normal));

        std::vector<planned_task> entries{};
        for (const auto& [id, value] : graph.tasks()) {
            entries.push_back({value, graph.dependencies(id)});
        }
        auto restored = task_graph::restore(entries, graph.next_sequence());
        CHECK(restored == graph);

        restored.add(detail::make_task(3U, task_priority::normal));
        CHECK(restored.at(3U).sequence == graph.next_sequence());
    }
}  // namespace parley::test
