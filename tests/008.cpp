#include "utils.hpp"

namespace parley::test {
    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    namespace detail {
        // State, adaptation and orchestrator wired the way the command line front end does it.
        struct engine_fixture {
            std::shared_ptr<memory_snapshot_store> store{std::make_shared<memory_snapshot_store>()};
            engine_config cfg{fast_engine()};
            state_manager state{cfg.state, store};
            adaptation_engine adaptation{cfg.adaptation, state};
            orchestrator runner;

            explicit engine_fixture(capability_set caps) : runner{state, adaptation, std::move(caps), cfg} {}
        };

        static capability_set scripted_set(
                std::shared_ptr<scripted_capability> content,
                std::shared_ptr<scripted_capability> speech,
                std::shared_ptr<scripted_capability> visual = nullptr) {
            capability_set caps{};
            caps.add(std::move(content)).add(std::move(speech));
            if (visual) {
                caps.add(std::move(visual));
            }
            return caps;
        }
    }  // namespace detail

    TEST_CASE("008: a quick session with the builtin analyzers", "[008][orchestrator]") {
        detail::quiet_logs quiet{};
        detail::engine_fixture fx{make_builtin_capabilities()};

        auto id = fx.runner.start_session(detail::sample_context(analysis_mode::quick), detail::sample_inputs());
        CHECK(id.starts_with("s-"));

        auto report = fx.runner.wait(id);

        CHECK(report.session_id == id);
        CHECK(report.outcome == session_outcome::completed);
        CHECK_FALSE(report.partial);
        CHECK(report.status_of(modality::content) == modality_status::ok);
        CHECK(report.status_of(modality::speech) == modality_status::ok);
        CHECK_FALSE(report.modalities.contains(modality::visual));
        REQUIRE(report.overall_score.has_value());
        CHECK(*report.overall_score > 0.0);
        CHECK(*report.overall_score <= 1.0);
        CHECK_FALSE(report.suggestions.empty());

        auto state = fx.runner.get_session_state(id);
        CHECK(state.tasks.all_terminal());
        CHECK(state.tasks.count(task_status::succeeded) == 4U);
        CHECK(state.feedback == report);
        CHECK_FALSE(fx.runner.running(id));
        CHECK(fx.adaptation.completed_sessions() == 1U);

        // revision 0 is the session before planning
        CHECK(fx.runner.get_session_state(id, 0U).tasks.empty());
    }

    TEST_CASE("008: a failed modality degrades the report", "[008][orchestrator]") {
        detail::quiet_logs quiet{};
        auto content = detail::succeeding(modality::content, 0.9);
        auto speech = detail::succeeding(modality::speech, 0.6);
        auto visual = detail::failing(modality::visual, analyzer_errc::transient_provider_error);
        detail::engine_fixture fx{detail::scripted_set(content, speech, visual)};

        auto id = fx.runner.start_session(detail::sample_context(analysis_mode::full, "s-partial"), detail::sample_inputs());
        auto report = fx.runner.wait(id);

        CHECK(id == "s-partial");
        CHECK(visual->calls() == 3U);
        CHECK(report.outcome == session_outcome::partial);
        CHECK(report.partial);
        CHECK(report.status_of(modality::visual) == modality_status::degraded);
        REQUIRE(report.modalities.at(modality::visual).error.has_value());
        CHECK_FALSE(report.modalities.at(modality::visual).score.has_value());

        // content 0.9 at weight 0.4, speech 0.6 at weight 0.3
        REQUIRE(report.overall_score.has_value());
        CHECK(*report.overall_score == Catch::Approx((0.9 * 0.4 + 0.6 * 0.3) / 0.7));

        CHECK(report.suggestions.size() == 2U);
        for (const auto& line : report.weaknesses) {
            CHECK(line.starts_with("speech"));
        }
        for (const auto& line : report.strengths) {
            CHECK(line.starts_with("content"));
        }
        CHECK(std::ranges::find(report.suggestions, "maintain more eye contact to show focus and confidence") ==
              report.suggestions.end());
    }

    TEST_CASE("008: cancelling a session is idempotent", "[008][orchestrator][cancel]") {
        detail::quiet_logs quiet{};
        auto release = std::make_shared<std::atomic<bool>>(false);
        auto speech = detail::stuck(modality::speech, release);
        detail::engine_fixture fx{detail::scripted_set(detail::succeeding(modality::content), speech)};

        auto id = fx.runner.start_session(detail::sample_context(analysis_mode::quick), detail::sample_inputs());
        REQUIRE(detail::wait_until([&] { return speech->calls() == 1U; }));
        CHECK(fx.runner.running(id));

        fx.runner.cancel_session(id);
        fx.runner.cancel_session(id);
        auto report = fx.runner.wait(id);
        release->store(true);

        CHECK(report.outcome == session_outcome::cancelled);
        CHECK_FALSE(fx.runner.running(id));
        CHECK_NOTHROW(fx.runner.cancel_session(id));
        CHECK(fx.runner.get_session_state(id).tasks.at(stage_ids::speech).status == task_status::cancelled);
        // cancelled sessions say nothing about analyzer quality
        CHECK(fx.adaptation.completed_sessions() == 0U);

        std::this_thread::sleep_for(20ms);
    }

    TEST_CASE("008: progress streams report every transition in order", "[008][orchestrator][progress]") {
        detail::quiet_logs quiet{};
        detail::engine_fixture fx{
                detail::scripted_set(detail::succeeding(modality::content), detail::succeeding(modality::speech))};

        progress_stream progress{};
        auto id = fx.runner.start_session(detail::sample_context(analysis_mode::quick), detail::sample_inputs(), &progress);
        fx.runner.wait(id);

        auto events = progress.drain();
        CHECK(progress.closed());
        // four tasks, each pending -> running -> succeeded
        REQUIRE(events.size() == 8U);
        for (size_t i = 1U; i < events.size(); ++i) {
            CHECK(events[i].revision > events[i - 1U].revision);
        }
        CHECK(events.back().task == stage_ids::feedback);
        CHECK(events.back().status == task_status::succeeded);

        auto speech_running = std::ranges::find_if(events, [](const progress_event& e) {
            return e.task == stage_ids::speech && e.status == task_status::running;
        });
        REQUIRE(speech_running != events.end());
        CHECK(speech_running->kind == modality::speech);
        CHECK(speech_running->session_id == id);
    }

    TEST_CASE("008: resuming a session only runs unfinished stages", "[008][orchestrator][resume]") {
        detail::quiet_logs quiet{};
        auto content = detail::succeeding(modality::content);
        auto speech = detail::succeeding(modality::speech);
        detail::engine_fixture fx{detail::scripted_set(content, speech)};

        // a session interrupted with content done and speech in flight
        auto& state = fx.state;
        state.create_session(detail::planned_session("s-crashed", analysis_mode::quick, detail::sample_inputs()));
        state.apply("s-crashed"sv, mutation::transition_task{.id = stage_ids::content, .to = task_status::running});
        auto result = std::make_shared<analysis_result>(detail::make_result(modality::content, 0.8));
        result->source_task = stage_ids::content;
        state.apply("s-crashed"sv, mutation::record_result{result});
        state.apply("s-crashed"sv, mutation::transition_task{.id = stage_ids::content, .to = task_status::succeeded});
        state.apply("s-crashed"sv, mutation::transition_task{.id = stage_ids::speech, .to = task_status::running});
        state.close_session("s-crashed"sv);

        fx.runner.resume_session("s-crashed"sv);
        auto report = fx.runner.wait("s-crashed"sv);

        CHECK(content->calls() == 0U);
        CHECK(speech->calls() == 1U);
        CHECK(report.outcome == session_outcome::completed);
        auto resumed = fx.runner.get_session_state("s-crashed"sv);
        CHECK(resumed.tasks.at(stage_ids::speech).attempt_count == 1U);
        CHECK(resumed.analysis.find(modality::content)->scores.at("relevance") == Catch::Approx(0.8));

        CHECK(fx.adaptation.completed_sessions() == 1U);

        // a finished session can be resumed again without doing any work
        fx.runner.resume_session("s-crashed"sv);
        CHECK(fx.runner.wait("s-crashed"sv).outcome == session_outcome::completed);
        CHECK(speech->calls() == 1U);
        CHECK(fx.adaptation.completed_sessions() == 1U);
    }

    TEST_CASE("008: finished sessions leave memory for the store", "[008][orchestrator][lifecycle]") {
        detail::quiet_logs quiet{};
        auto release = std::make_shared<std::atomic<bool>>(true);
        auto speech = detail::stuck(modality::speech, release);
        detail::engine_fixture fx{detail::scripted_set(detail::succeeding(modality::content), speech)};
        const std::vector<std::string> only_global{std::string{global_session_id}};

        std::vector<std::string> ids{"s-done-1", "s-done-2", "s-done-3"};
        for (const auto& id : ids) {
            fx.runner.start_session(detail::sample_context(analysis_mode::quick, id), detail::sample_inputs());
            fx.runner.wait(id);
        }
        CHECK(fx.state.sessions() == only_global);
        CHECK(fx.adaptation.completed_sessions() == 3U);

        for (const auto& id : ids) {
            auto archived = fx.runner.get_session_state(id);
            CHECK(archived.tasks.all_terminal());
            CHECK(archived.feedback.outcome == session_outcome::completed);
            CHECK(fx.runner.wait(id) == archived.feedback);
            CHECK_FALSE(fx.runner.running(id));
            CHECK_NOTHROW(fx.runner.cancel_session(id));
        }

        release->store(false);
        fx.runner.start_session(detail::sample_context(analysis_mode::quick, "s-live"), detail::sample_inputs());
        REQUIRE(detail::wait_until([&] { return speech->calls() == 4U; }));
        CHECK(fx.state.sessions() == std::vector<std::string>{std::string{global_session_id}, "s-live"});

        release->store(true);
        CHECK(fx.runner.wait("s-live"sv).outcome == session_outcome::completed);
        CHECK(fx.state.sessions() == only_global);
    }

    TEST_CASE("008: a cancel before launch stops the run at once", "[008][orchestrator][cancel]") {
        detail::quiet_logs quiet{};
        auto content = detail::succeeding(modality::content);
        auto speech = detail::succeeding(modality::speech);
        detail::engine_fixture fx{detail::scripted_set(content, speech)};

        // planned and stored, but no run yet
        fx.state.create_session(detail::planned_session("s-early", analysis_mode::quick, detail::sample_inputs()));
        fx.runner.cancel_session("s-early"sv);
        fx.runner.cancel_session("s-early"sv);
        CHECK_FALSE(fx.runner.running("s-early"sv));

        fx.runner.resume_session("s-early"sv);
        auto report = fx.runner.wait("s-early"sv);

        CHECK(report.outcome == session_outcome::cancelled);
        CHECK(content->calls() == 0U);
        CHECK(speech->calls() == 0U);
        CHECK(fx.adaptation.completed_sessions() == 0U);
        CHECK(fx.runner.get_session_state("s-early"sv).tasks.count(task_status::cancelled) == 4U);
    }

    TEST_CASE("008: unknown and duplicate sessions are rejected", "[008][orchestrator]") {
        detail::quiet_logs quiet{};
        detail::engine_fixture fx{make_builtin_capabilities()};

        CHECK_THROWS_AS(fx.runner.get_session_state("nope"sv), unknown_session_error);
        CHECK_THROWS_AS(fx.runner.cancel_session("nope"sv), unknown_session_error);
        CHECK_THROWS_AS(fx.runner.resume_session("nope"sv), unknown_session_error);
        CHECK_THROWS_AS(fx.runner.wait("nope"sv), unknown_session_error);

        auto id = fx.runner.start_session(detail::sample_context(analysis_mode::quick, "s-dup"), detail::sample_inputs());
        CHECK_THROWS_AS(
                fx.runner.start_session(detail::sample_context(analysis_mode::quick, "s-dup"), detail::sample_inputs()),
                error);
        fx.runner.wait(id);

        auto bad = default_engine_config();
        bad.executor.workers = 0U;
        CHECK_THROWS_AS(orchestrator(fx.state, fx.adaptation, make_builtin_capabilities(), bad), invalid_configuration_error);
    }

    TEST_CASE("008: submissions load from json", "[008][submission]") {
        auto parsed = parse_submission(R"({
            "job_position": "data engineer",
            "mode": "FULL",
            "focus_weights": {"content": 1.5},
            "transcript": {"ref": "t.txt", "text": "We built pipelines."},
            "video": {"ref": "v.mp4", "features": {"eye_contact": 7.5}},
            "comment": "ignored"
        })"sv);

        CHECK(parsed.context.session_id.empty());
        CHECK(parsed.context.job_position == "data engineer");
        CHECK(parsed.context.mode == analysis_mode::full);
        CHECK(parsed.context.focus_weights.at("content") == Catch::Approx(1.5));
        REQUIRE(parsed.inputs.transcript.has_value());
        CHECK(parsed.inputs.transcript->text == "We built pipelines.");
        CHECK_FALSE(parsed.inputs.audio.has_value());
        REQUIRE(parsed.inputs.video.has_value());
        CHECK(parsed.inputs.video->features.at("eye_contact") == Catch::Approx(7.5));

        CHECK_THROWS_AS(parse_submission(R"({"mode": "deep"})"sv), error);
        CHECK_THROWS_AS(parse_submission(R"({"mode": )"sv), error);

        detail::temp_dir tmp{"parley_008_submission"};
        auto path = tmp.path / "submission.json";
        detail::write_text_file(path, R"({"session_id": "s-file", "transcript": {"ref": "a", "text": "hello"}})");
        auto loaded = load_submission(path);
        CHECK(loaded.context.session_id == "s-file");
        CHECK(loaded.context.mode == analysis_mode::quick);
        CHECK_THROWS_AS(load_submission(tmp.path / "missing.json"), error);
    }
}  // namespace parley::test
