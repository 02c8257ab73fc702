#include "utils.hpp"

namespace parley::test {
    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    namespace detail {
        // A mid-flight session: content done, speech waiting out a retry backoff, visual running.
        static graph_state busy_session(std::string id) {
            auto state = planned_session(std::move(id), analysis_mode::full, sample_inputs());
            state.context.focus_weights = {{"content", 1.5}};
            auto t0 = timestamp{std::chrono::milliseconds{1'700'000'000'000}};

            state.tasks.transition(stage_ids::content, task_status::running, t0);
            auto result = std::make_shared<analysis_result>(make_result(modality::content, 0.82, 0.7));
            result->source_task = stage_ids::content;
            result->raw_features = R"({"words":42})";
            state.analysis.record(result);
            state.tasks.transition(stage_ids::content, task_status::succeeded, t0 + 20ms);

            state.tasks.transition(stage_ids::speech, task_status::running, t0);
            state.tasks.transition(stage_ids::speech, task_status::failed, t0 + 5ms, "transient_provider_error: 503");
            state.tasks.transition(stage_ids::speech, task_status::pending, t0 + 5ms, std::nullopt, t0 + 1'005ms);

            state.tasks.transition(stage_ids::visual, task_status::running, t0 + 6ms);
            state.revision = 9U;
            state.feedback = build_report(state);
            return state;
        }

        template <typename Store>
        static void exercise_store(Store& store) {
            auto state = busy_session("s-1");
            for (uint64_t rev : {3U, 1U, 2U}) {
                state.revision = rev;
                store.put(state);
            }
            auto other = busy_session("s-2");
            other.revision = 0U;
            store.put(other);

            CHECK(store.revisions("s-1"sv) == std::vector<uint64_t>{1U, 2U, 3U});
            CHECK(store.sessions() == std::vector<std::string>{"s-1", "s-2"});
            CHECK(store.latest_revision("s-1"sv) == 3U);
            CHECK_FALSE(store.latest_revision("s-3"sv).has_value());
            CHECK_FALSE(store.get("s-1"sv, 7U).has_value());

            auto loaded = store.get("s-1"sv, 2U);
            REQUIRE(loaded.has_value());
            CHECK(loaded->revision == 2U);
            CHECK(loaded->tasks == state.tasks);

            store.truncate_after("s-1"sv, 1U);
            CHECK(store.revisions("s-1"sv) == std::vector<uint64_t>{1U});

            store.remove_session("s-2"sv);
            CHECK(store.sessions() == std::vector<std::string>{"s-1"});
        }
    }  // namespace detail

    TEST_CASE("004: snapshot codec round trips a session in flight", "[004][snapshot]") {
        auto state = detail::busy_session("s-roundtrip");
        auto json = encode_snapshot(state);

        CHECK(json.find("\"schema_version\":1") != std::string::npos);
        CHECK(json.find("\"status\":\"running\"") != std::string::npos);

        auto decoded = decode_snapshot(json);
        CHECK(decoded == state);

        const auto& speech = decoded.tasks.at(stage_ids::speech);
        CHECK(speech.attempt_count == 1U);
        CHECK(speech.last_error == "transient_provider_error: 503");
        REQUIRE(speech.eligible_at.has_value());
        CHECK(speech.eligible_at->time_since_epoch() == 1'700'000'001'005ms);
        CHECK(decoded.tasks.dependencies(stage_ids::integration).size() == 3U);
        CHECK(decoded.analysis.find(modality::content)->raw_features == R"({"words":42})");
        CHECK(decoded.feedback.status_of(modality::content) == modality_status::ok);
    }

    TEST_CASE("004: snapshot codec rejects bad documents", "[004][snapshot]") {
        auto json = encode_snapshot(detail::busy_session("s-bad"));

        SECTION("newer schema version") {
            auto newer = json;
            auto pos = newer.find("\"schema_version\":1");
            REQUIRE(pos != std::string::npos);
            newer.replace(pos, 18U, "\"schema_version\":2");
            CHECK_THROWS_AS(decode_snapshot(newer), error);
        }

        SECTION("unknown task status") {
            auto broken = json;
            auto pos = broken.find("\"status\":\"running\"");
            REQUIRE(pos != std::string::npos);
            broken.replace(pos, 18U, "\"status\":\"zombie\"");
            CHECK_THROWS_AS(decode_snapshot(broken), error);
        }

        SECTION("truncated json") {
            CHECK_THROWS_AS(decode_snapshot(std::string_view{json}.substr(0U, json.size() / 2U)), error);
        }
    }

    TEST_CASE("004: memory store keeps revisions per session", "[004][snapshot][store]") {
        memory_snapshot_store store{};
        detail::exercise_store(store);
        CHECK(store.put_count() == 4U);
    }

    TEST_CASE("004: directory store lays snapshots out per session", "[004][snapshot][store]") {
        detail::temp_dir tmp{"parley_004_store"};
        directory_snapshot_store store{tmp.path};
        detail::exercise_store(store);

        auto file = tmp.path / "sessions" / "s-1" / "1.json";
        CHECK(detail::fs::exists(file));
        CHECK_FALSE(detail::fs::exists(tmp.path / "sessions" / "s-1" / "2.json"));
        CHECK_FALSE(detail::fs::exists(tmp.path / "sessions" / "s-1" / "1.json.tmp"));
        CHECK(decode_snapshot(detail::read_text_file(file)).revision == 1U);

        auto escaping = detail::busy_session("../outside");
        CHECK_THROWS_AS(store.put(escaping), error);
        CHECK_THROWS_AS(store.session_dir(""sv), error);
    }

    TEST_CASE("004: sessions survive a restart through the directory store", "[004][snapshot][resume]") {
        detail::temp_dir tmp{"parley_004_restart"};
        auto state = detail::busy_session("s-restart");
        state.revision = 0U;

        {
            auto store = std::make_shared<directory_snapshot_store>(tmp.path);
            state_manager manager{state_manager_config{}, store};
            manager.create_session(state);
            manager.apply("s-restart"sv, mutation::adjust_params{{{"speech.threshold", 0.05}}});
            manager.close_session("s-restart"sv);
            CHECK_FALSE(manager.contains("s-restart"sv));
        }

        auto store = std::make_shared<directory_snapshot_store>(tmp.path);
        state_manager manager{state_manager_config{}, store};
        auto resumed = manager.resume("s-restart"sv);

        CHECK(resumed.parameters.at("speech.threshold") == Catch::Approx(0.75));
        CHECK(resumed.tasks.at(stage_ids::content).status == task_status::succeeded);
        // visual was caught running and goes back to the queue
        CHECK(resumed.tasks.at(stage_ids::visual).status == task_status::pending);
        CHECK(resumed.tasks.at(stage_ids::visual).attempt_count == 0U);
        CHECK(resumed.tasks.at(stage_ids::speech).status == task_status::pending);
        CHECK(resumed.revision == 2U);
    }
}  // namespace parley::test
