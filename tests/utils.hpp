#pragma once

#include "parley/parley.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace parley::test {
    using namespace parley::literals;
}  // namespace parley::test

namespace parley::test { namespace detail {
    namespace fs = std::filesystem;
    using namespace std::chrono_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Keeps test output readable; restores the threshold on scope exit.
    struct quiet_logs {
        log_level previous{current_log_level()};

        explicit quiet_logs(log_level level = log_level::off) { set_log_level(level); }
        ~quiet_logs() { set_log_level(previous); }
    };

    static void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    static std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    template <typename Pred>
    static bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(1ms);
        }
        return pred();
    }

    // Analyzer whose behaviour is supplied by the test; counts calls.
    class scripted_capability final : public analyzer_capability {
      public:
        using script = std::function<analysis_outcome(const capability_request&)>;

        scripted_capability(modality kind, script fn) : kind_{kind}, fn_{std::move(fn)} {}

        modality kind() const override { return kind_; }

        analysis_outcome analyze(const capability_request& request) override {
            calls_.fetch_add(1U);
            return fn_(request);
        }

        uint32_t calls() const { return calls_.load(); }

      private:
        modality kind_;
        script fn_;
        std::atomic<uint32_t> calls_{0U};
    };

    static analysis_result make_result(modality kind, double score, double confidence = 0.9) {
        analysis_result r{};
        r.kind = kind;
        r.confidence = confidence;
        r.produced_at = now_ms();
        switch (kind) {
            case modality::speech:
                r.scores = {{"clarity", score}, {"pace", score}};
                break;
            case modality::visual:
                r.scores = {{"eye_contact", score}, {"posture", score}};
                break;
            case modality::content:
                r.scores = {{"relevance", score}, {"structure", score}};
                break;
        }
        return r;
    }

    static std::shared_ptr<scripted_capability> succeeding(modality kind, double score = 0.85) {
        return std::make_shared<scripted_capability>(
                kind, [kind, score](const capability_request&) -> analysis_outcome { return make_result(kind, score); });
    }

    static std::shared_ptr<scripted_capability> failing(modality kind, analyzer_errc code) {
        return std::make_shared<scripted_capability>(kind, [code](const capability_request&) -> analysis_outcome {
            return std::unexpected(analyzer_error{code, "scripted failure"});
        });
    }

    // Ignores its stop token until `release` is set; honours it afterwards.
    static std::shared_ptr<scripted_capability> stuck(
            modality kind, std::shared_ptr<std::atomic<bool>> release) {
        return std::make_shared<scripted_capability>(
                kind, [kind, release](const capability_request&) -> analysis_outcome {
                    while (!release->load()) {
                        std::this_thread::sleep_for(1ms);
                    }
                    return make_result(kind, 0.5);
                });
    }

    static executor_config fast_executor(size_t workers = 4U) {
        executor_config cfg{};
        cfg.workers = workers;
        cfg.task_timeout = 2s;
        cfg.max_attempts = 3U;
        cfg.backoff_base = 1ms;
        cfg.backoff_cap = 4ms;
        return cfg;
    }

    static engine_config fast_engine(size_t workers = 4U) {
        auto cfg = default_engine_config();
        cfg.executor = fast_executor(workers);
        return cfg;
    }

    static session_inputs sample_inputs(bool with_audio = true, bool with_video = true) {
        session_inputs inputs{};
        inputs.transcript = modality_input{
                "transcript.txt",
                "I led the backend team that rebuilt our payment service. We measured latency first. Then we "
                "split the monolith and improved throughput by forty percent. The result was a faster and more "
                "reliable system for every customer.",
                {}};
        if (with_audio) {
            inputs.audio = modality_input{
                    "answer.wav",
                    "",
                    {{"spectral_centroid", 2200.0},
                     {"zero_crossing_rate", 0.08},
                     {"tempo", 120.0},
                     {"rms", 0.2},
                     {"pause_ratio", 0.1}}};
        }
        if (with_video) {
            inputs.video = modality_input{
                    "answer.mp4",
                    "",
                    {{"eye_contact", 0.8}, {"facial_expression", 0.7}, {"posture", 0.9}, {"gestures", 0.6}}};
        }
        return inputs;
    }

    static user_context sample_context(analysis_mode mode = analysis_mode::quick, std::string session_id = {}) {
        user_context ctx{};
        ctx.session_id = std::move(session_id);
        ctx.job_position = "backend engineer";
        ctx.mode = mode;
        return ctx;
    }

    // A session registered with the planner's task set, ready for an executor.
    static graph_state planned_session(
            std::string id, analysis_mode mode, session_inputs inputs, const executor_config& exec = fast_executor()) {
        graph_state state{};
        state.session_id = id;
        state.context = sample_context(mode, id);
        state.inputs = std::move(inputs);
        state.parameters = default_parameters();
        state.bounds = default_parameter_bounds();
        state.tasks.add(plan(state.context, state.inputs, state.parameters, planner_config{}, exec.max_attempts));
        state.feedback = build_report(state);
        return state;
    }

}}  // namespace parley::test::detail
