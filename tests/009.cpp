#include "utils.hpp"

namespace parley::test {
    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    namespace detail {
        static analysis_outcome analyze_with(
                analyzer_capability& analyzer,
                const modality_input& input,
                const param_map& params,
                deadline_context deadline = {}) {
            capability_request request{
                    .task = 7U,
                    .kind = analyzer.kind(),
                    .attempt = 1U,
                    .job_position = "backend engineer",
                    .input = input,
                    .params = params,
                    .deadline = deadline};
            return analyzer.analyze(request);
        }

        static void finish(graph_state& state, task_id id, task_status to, bool permanent = false) {
            auto at = now_ms();
            state.tasks.transition(id, task_status::running, at);
            std::optional<std::string> reason{};
            if (to == task_status::failed) {
                reason = "boom";
            }
            state.tasks.transition(id, to, at, std::move(reason), std::nullopt, permanent);
        }

        static void record(graph_state& state, modality kind, std::map<std::string, double> scores) {
            auto result = std::make_shared<analysis_result>();
            result->kind = kind;
            result->source_task = stage_id(task_type_for(kind));
            result->scores = std::move(scores);
            result->confidence = 0.8;
            state.analysis.record(std::move(result));
        }
    }  // namespace detail

    TEST_CASE("009: speech features are scored", "[009][capabilities]") {
        speech_feature_analyzer analyzer{};
        auto inputs = detail::sample_inputs();
        auto params = default_parameters();

        auto outcome = detail::analyze_with(analyzer, *inputs.audio, params);
        REQUIRE(outcome.has_value());
        CHECK(outcome->kind == modality::speech);
        CHECK(outcome->scores.at("clarity") == Catch::Approx(0.7));
        CHECK(outcome->scores.at("pace") == Catch::Approx(1.0));
        CHECK(outcome->scores.at("volume") == Catch::Approx(1.0));
        CHECK(outcome->scores.at("fluency") == Catch::Approx(0.85));
        CHECK(outcome->confidence == Catch::Approx(1.0));
        CHECK(outcome->raw_features.find("\"tempo\"") != std::string::npos);

        modality_input partial{"quiet.wav", "", {{"tempo", 170.0}}};
        auto sparse = detail::analyze_with(analyzer, partial, params);
        REQUIRE(sparse.has_value());
        CHECK(sparse->scores.size() == 1U);
        CHECK(sparse->scores.at("pace") == Catch::Approx(0.6));
        // 1 of 5 features, below threshold: (0.5 + 0.1) * 0.9
        CHECK(sparse->confidence == Catch::Approx(0.54));

        auto empty = detail::analyze_with(analyzer, modality_input{"none.wav", "", {}}, params);
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == analyzer_errc::input_unavailable);
    }

    TEST_CASE("009: visual features accept both scales", "[009][capabilities]") {
        visual_feature_analyzer analyzer{};
        modality_input input{"v.mp4", "", {{"eye_contact", 7.5}, {"posture", 0.9}, {"blinks", 3.0}}};

        auto outcome = detail::analyze_with(analyzer, input, default_parameters());
        REQUIRE(outcome.has_value());
        CHECK(outcome->scores.size() == 2U);
        CHECK(outcome->scores.at("eye_contact") == Catch::Approx(0.75));
        CHECK(outcome->scores.at("posture") == Catch::Approx(0.9));
        CHECK(outcome->confidence == Catch::Approx(0.75));

        auto nothing = detail::analyze_with(analyzer, modality_input{"v.mp4", "", {{"blinks", 3.0}}}, default_parameters());
        REQUIRE_FALSE(nothing.has_value());
        CHECK(nothing.error().code == analyzer_errc::input_unavailable);
    }

    TEST_CASE("009: transcripts are scored against the role", "[009][capabilities]") {
        content_feature_analyzer analyzer{};
        auto inputs = detail::sample_inputs();

        auto outcome = detail::analyze_with(analyzer, *inputs.transcript, default_parameters());
        REQUIRE(outcome.has_value());
        // "backend" appears in the answer, "engineer" does not
        CHECK(outcome->scores.at("relevance") == Catch::Approx(0.75));
        CHECK(outcome->scores.at("structure") == Catch::Approx(1.0));
        CHECK(outcome->scores.at("clarity") == Catch::Approx(0.9));
        for (const auto& [name, value] : outcome->scores) {
            CHECK(value >= 0.0);
            CHECK(value <= 1.0);
        }

        auto blank = detail::analyze_with(analyzer, modality_input{"t.txt", "   \n", {}}, default_parameters());
        REQUIRE_FALSE(blank.has_value());
        CHECK(blank.error().code == analyzer_errc::input_unavailable);
    }

    TEST_CASE("009: analyzers honour deadlines and params", "[009][capabilities]") {
        content_feature_analyzer analyzer{};
        auto inputs = detail::sample_inputs();

        deadline_context past{std::chrono::steady_clock::now() - 1ms, {}};
        auto late = detail::analyze_with(analyzer, *inputs.transcript, default_parameters(), past);
        REQUIRE_FALSE(late.has_value());
        CHECK(late.error().code == analyzer_errc::deadline_exceeded);
        CHECK(late.error().retryable());

        std::stop_source stop{};
        stop.request_stop();
        deadline_context stopping{std::chrono::steady_clock::time_point::max(), stop.get_token()};
        auto stopped = detail::analyze_with(analyzer, *inputs.transcript, default_parameters(), stopping);
        REQUIRE_FALSE(stopped.has_value());
        CHECK(stopped.error().code == analyzer_errc::cancelled);

        auto params = default_parameters();
        params["content.threshold"] = 1.5;
        auto invalid = detail::analyze_with(analyzer, *inputs.transcript, params);
        REQUIRE_FALSE(invalid.has_value());
        CHECK(invalid.error().code == analyzer_errc::invalid_params);
        CHECK_FALSE(invalid.error().retryable());

        CHECK_FALSE(validate_params(modality::speech, params).has_value());
        params["speech.threshold"] = std::numeric_limits<double>::quiet_NaN();
        CHECK(validate_params(modality::visual, params).has_value());

        auto builtin = make_builtin_capabilities();
        CHECK(builtin.size() == 3U);
        CHECK(builtin.get(modality::visual)->kind() == modality::visual);
    }

    TEST_CASE("009: report weights, strengths and suggestions", "[009][report]") {
        auto state = detail::planned_session("s-report", analysis_mode::full, detail::sample_inputs());
        state.context.focus_weights = {{"content", 2.0}};

        detail::finish(state, stage_ids::content, task_status::succeeded);
        detail::record(state, modality::content, {{"relevance", 0.9}, {"structure", 0.5}});
        detail::finish(state, stage_ids::speech, task_status::succeeded);
        detail::record(state, modality::speech, {{"clarity", 0.85}});
        detail::finish(state, stage_ids::visual, task_status::failed, true);

        auto report = build_report(state);
        CHECK(report.outcome == session_outcome::running);
        CHECK(report.partial);
        CHECK(report.modalities.at(modality::visual).error == "boom");

        // content mean 0.7 at 0.4 * 2.0, speech 0.85 at 0.3
        REQUIRE(report.overall_score.has_value());
        CHECK(*report.overall_score == Catch::Approx((0.7 * 0.8 + 0.85 * 0.3) / 1.1));

        CHECK(report.strengths.size() == 2U);
        CHECK(std::ranges::find(report.strengths, "content - relevance: 0.90") != report.strengths.end());
        CHECK(std::ranges::find(report.strengths, "speech - clarity: 0.85") != report.strengths.end());
        CHECK(report.weaknesses == std::vector<std::string>{"content - structure: 0.50"});
        CHECK(report.suggestions ==
              std::vector<std::string>{"organize answers with a clear beginning, body and conclusion"});

        detail::finish(state, stage_ids::integration, task_status::succeeded);
        detail::finish(state, stage_ids::feedback, task_status::succeeded);
        CHECK(build_report(state).outcome == session_outcome::partial);

        auto json = report_to_json(build_report(state));
        CHECK(json.find("\"session_id\":\"s-report\"") != std::string::npos);
        CHECK(json.find("\"outcome\":\"partial\"") != std::string::npos);
        CHECK(json.find("\"status\":\"degraded\"") != std::string::npos);
    }

    TEST_CASE("009: session outcomes", "[009][report]") {
        auto state = detail::planned_session("s-outcome", analysis_mode::quick, detail::sample_inputs());
        CHECK(state.feedback.outcome == session_outcome::running);
        CHECK(state.feedback.status_of(modality::speech) == modality_status::pending);
        CHECK(state.feedback.status_of(modality::visual) == modality_status::absent);
        CHECK_FALSE(state.feedback.overall_score.has_value());

        SECTION("clean run completes") {
            detail::finish(state, stage_ids::content, task_status::succeeded);
            detail::record(state, modality::content, {{"clarity", 0.5}});
            detail::finish(state, stage_ids::speech, task_status::succeeded);
            detail::record(state, modality::speech, {{"clarity", 0.95}});
            detail::finish(state, stage_ids::integration, task_status::succeeded);
            detail::finish(state, stage_ids::feedback, task_status::succeeded);

            auto report = build_report(state);
            CHECK(report.outcome == session_outcome::completed);
            CHECK_FALSE(report.partial);
            // content clarity is about wording, not delivery
            CHECK(report.suggestions == std::vector<std::string>{"state points plainly and avoid ambiguous phrasing"});
        }

        SECTION("no modality succeeded") {
            detail::finish(state, stage_ids::content, task_status::failed, true);
            detail::finish(state, stage_ids::speech, task_status::skipped);
            detail::finish(state, stage_ids::integration, task_status::failed, true);
            state.tasks.transition(stage_ids::feedback, task_status::skipped, now_ms());
            CHECK(build_report(state).outcome == session_outcome::failed);
        }

        SECTION("cancellation wins") {
            detail::finish(state, stage_ids::content, task_status::succeeded);
            detail::record(state, modality::content, {{"relevance", 0.9}});
            for (auto id : {stage_ids::speech, stage_ids::integration, stage_ids::feedback}) {
                state.tasks.transition(id, task_status::cancelled, now_ms());
            }
            CHECK(build_report(state).outcome == session_outcome::cancelled);
        }
    }

    TEST_CASE("009: modality weights", "[009][report]") {
        param_map params{{"integration.weight.speech", 0.5}};
        CHECK(modality_weight(modality::speech, params, {}) == Catch::Approx(0.5));
        CHECK(modality_weight(modality::visual, params, {}) == Catch::Approx(0.3));
        CHECK(modality_weight(modality::speech, params, {{"speech", 3.0}}) == Catch::Approx(1.5));
        CHECK(modality_weight(modality::content, {}, {{"content", -1.0}}) == Catch::Approx(0.0));
        CHECK_FALSE(modality_score({}).has_value());
        CHECK(*modality_score({{"a", 0.2}, {"b", 0.4}}) == Catch::Approx(0.3));
    }
}  // namespace parley::test
