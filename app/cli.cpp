#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace parley::literals;

namespace parley::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static void print_config(const startup_config& cfg, const engine_config& engine, std::ostream& os) {
            os << "submission=" << (cfg.submission ? cfg.submission->string() : "<none>") << '\n';
            os << "config=" << (cfg.config_file ? cfg.config_file->string() : "<defaults>") << '\n';
            os << "cache_dir=" << cfg.cache_dir.string() << '\n';
            os << "resume=" << (cfg.resume_session ? *cfg.resume_session : "<none>") << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
            os << "engine=" << engine_config_to_json(engine) << '\n';
        }

        static engine_config resolve_engine_config(const startup_config& cfg) {
            auto engine = cfg.config_file ? load_engine_config(*cfg.config_file) : default_engine_config();
            if (cfg.workers) {
                engine.executor.workers = *cfg.workers;
            }
            if (cfg.timeout_ms) {
                engine.executor.task_timeout = std::chrono::milliseconds{*cfg.timeout_ms};
            }
            validate_engine_config(engine);
            return engine;
        }

        // Generated ids sort by creation time, so "latest" is the greatest stored id.
        static std::string resolve_resume_id(const std::string& requested, const snapshot_store& store) {
            if (requested != "latest"sv) {
                return requested;
            }
            std::optional<std::string> latest{};
            for (auto& id : store.sessions()) {
                if (id == global_session_id) {
                    continue;
                }
                if (!latest || id > *latest) {
                    latest = std::move(id);
                }
            }
            if (!latest) {
                throw error{"no stored session to resume"};
            }
            return *latest;
        }

        static std::string format_score(const std::optional<double>& value) {
            return value ? "{:.2f}"_format(*value) : std::string{"-"};
        }

        static void render_list(std::string_view title, const std::vector<std::string>& items, std::ostream& os) {
            if (items.empty()) {
                return;
            }
            os << title << ":\n";
            for (const auto& item : items) {
                os << "  - " << item << '\n';
            }
        }

        static void render_report_table(const session_report& report, std::ostream& os) {
            os << ("session: {}\n"
                   "outcome: {}{}\n"
                   "overall: {}\n"_format(
                           report.session_id,
                           report.outcome,
                           report.partial ? " (partial)"sv : ""sv,
                           format_score(report.overall_score)));

            os << std::left << std::setw(10) << "modality" << std::setw(10) << "status" << std::setw(8) << "score"
               << std::setw(12) << "confidence"
               << "note\n";
            for (const auto& [kind, summary] : report.modalities) {
                os << std::left << std::setw(10) << to_string(kind) << std::setw(10) << to_string(summary.status)
                   << std::setw(8) << format_score(summary.score) << std::setw(12) << format_score(summary.confidence)
                   << summary.error.value_or("") << '\n';
            }

            render_list("strengths"sv, report.strengths, os);
            render_list("weaknesses"sv, report.weaknesses, os);
            render_list("suggestions"sv, report.suggestions, os);
        }

        static void render_report(const session_report& report, output_mode mode, std::ostream& os) {
            if (mode == output_mode::json) {
                os << report_to_json(report) << '\n';
                return;
            }
            render_report_table(report, os);
        }

        static void print_progress(progress_stream& progress, std::ostream& os) {
            while (auto event = progress.next()) {
                os << "[rev {}] task {} ({}) -> {}\n"_format(event->revision, event->task, event->type, event->status);
            }
        }

    }  // namespace detail

    int run_session(const startup_config& cfg) {
        if (cfg.quiet) {
            set_log_level(log_level::error);
        }
        else if (cfg.verbose) {
            set_log_level(log_level::debug);
        }
        else {
            set_log_level(log_level::warn);
        }

        auto engine = detail::resolve_engine_config(cfg);
        engine.adaptation.event_log_file = cfg.cache_dir / "adaptation_events.json";
        auto store = std::make_shared<directory_snapshot_store>(cfg.cache_dir);
        state_manager state{engine.state, store};
        adaptation_engine adaptation{engine.adaptation, state};
        orchestrator runner{state, adaptation, make_builtin_capabilities(), engine};

        progress_stream progress{};
        std::string session_id{};
        if (cfg.resume_session) {
            session_id = detail::resolve_resume_id(*cfg.resume_session, *store);
            runner.resume_session(session_id, &progress);
        }
        else {
            auto input = load_submission(*cfg.submission);
            session_id = runner.start_session(std::move(input.context), std::move(input.inputs), &progress);
        }

        if (cfg.verbose) {
            detail::print_progress(progress, std::cerr);
        }
        auto report = runner.wait(session_id);
        state.flush_all();

        detail::render_report(report, cfg.output, std::cout);
        if (!cfg.quiet && cfg.output == output_mode::table) {
            std::cout << "snapshots: " << store->session_dir(session_id).string() << '\n';
        }

        switch (report.outcome) {
            case session_outcome::completed:
            case session_outcome::partial:
                return 0;
            case session_outcome::running:
            case session_outcome::failed:
            case session_outcome::cancelled:
                return 1;
        }
        return 1;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"parley"};

        bool show_version = false;
        std::string submission_arg{};
        std::string config_arg{};
        std::string resume_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string cache_dir_arg{cfg.cache_dir.string()};
        std::optional<unsigned> workers_arg{};
        std::optional<int> timeout_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--submission", submission_arg, "Session submission JSON file");
        app.add_option("--config", config_arg, "Engine config JSON file");
        app.add_option("--cache-dir", cache_dir_arg, "Snapshot directory");
        app.add_option("--resume", resume_arg, "Resume a stored session: <id>|latest");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--workers", workers_arg, "Worker threads per session");
        app.add_option("--timeout-ms", timeout_arg, "Deadline for one analyzer call");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--dump-defaults", cfg.dump_defaults, "Print the default engine config as JSON and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (workers_arg && *workers_arg == 0U) {
            std::cerr << "invalid --workers value: 0 (expected at least 1)\n";
            return std::optional<int>{2};
        }
        if (timeout_arg && *timeout_arg <= 0) {
            std::cerr << "invalid --timeout-ms value: " << *timeout_arg << " (expected a positive value)\n";
            return std::optional<int>{2};
        }

        if (auto path = detail::normalize_optional(submission_arg)) {
            cfg.submission = *path;
        }
        if (auto path = detail::normalize_optional(config_arg)) {
            cfg.config_file = *path;
        }
        cfg.resume_session = detail::normalize_optional(resume_arg);
        cfg.cache_dir = cache_dir_arg;
        cfg.workers = workers_arg;
        cfg.timeout_ms = timeout_arg;

        if (show_version) {
            std::cout << "parley 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.dump_defaults) {
            std::cout << engine_config_to_json(default_engine_config()) << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, detail::resolve_engine_config(cfg), std::cout);
            return std::optional<int>{0};
        }

        if (!cfg.submission && !cfg.resume_session) {
            std::cerr << "one of --submission or --resume is required\n";
            return std::optional<int>{2};
        }
        if (cfg.submission && cfg.resume_session) {
            std::cerr << "--submission and --resume are mutually exclusive\n";
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

}  // namespace parley::cli
