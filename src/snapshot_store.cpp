#include "parley/snapshot_store.hpp"

#include "internal/json_io.hpp"
#include "internal/types.hpp"

#include "parley/errors.hpp"
#include "parley/format.hpp"

#include <algorithm>
#include <system_error>

using namespace parley::literals;

namespace parley {
    namespace detail {

        using namespace parley::internal;
        namespace fs = std::filesystem;

        static int64_t to_ms(timestamp t) {
            return t.time_since_epoch().count();
        }

        static timestamp from_ms(int64_t ms) {
            return timestamp{std::chrono::milliseconds{ms}};
        }

        static std::optional<int64_t> to_ms(const std::optional<timestamp>& t) {
            if (!t) {
                return std::nullopt;
            }
            return to_ms(*t);
        }

        static std::optional<timestamp> from_ms(const std::optional<int64_t>& ms) {
            if (!ms) {
                return std::nullopt;
            }
            return from_ms(*ms);
        }

        static std::optional<persisted_input> make_persisted(const std::optional<modality_input>& input) {
            if (!input) {
                return std::nullopt;
            }
            return persisted_input{input->ref, input->text, input->features};
        }

        static std::optional<modality_input> apply_persisted(const std::optional<persisted_input>& input) {
            if (!input) {
                return std::nullopt;
            }
            return modality_input{input->ref, input->text, input->features};
        }

        static persisted_graph_state make_persisted(const graph_state& state) {
            persisted_graph_state data{};
            data.session_id = state.session_id;
            data.revision = state.revision;
            data.job_position = state.context.job_position;
            data.mode = std::string{to_string(state.context.mode)};
            data.focus_weights = state.context.focus_weights;
            data.transcript = make_persisted(state.inputs.transcript);
            data.audio = make_persisted(state.inputs.audio);
            data.video = make_persisted(state.inputs.video);
            data.next_sequence = state.tasks.next_sequence();

            for (const auto& [id, t] : state.tasks.tasks()) {
                const auto& deps = state.tasks.dependencies(id);
                data.tasks.push_back(persisted_task{
                        .id = t.id,
                        .type = std::string{to_string(t.type)},
                        .priority = std::string{to_string(t.priority)},
                        .status = std::string{to_string(t.status)},
                        .input_ref = t.input_ref,
                        .input_params = t.input_params,
                        .best_effort = t.best_effort,
                        .sequence = t.sequence,
                        .created_at_ms = to_ms(t.created_at),
                        .started_at_ms = to_ms(t.started_at),
                        .finished_at_ms = to_ms(t.finished_at),
                        .eligible_at_ms = to_ms(t.eligible_at),
                        .attempt_count = t.attempt_count,
                        .max_attempts = t.max_attempts,
                        .last_error = t.last_error,
                        .dependencies = deps});
            }

            for (const auto& [kind, result] : state.analysis.results) {
                data.results.push_back(persisted_result{
                        .task_id = result->source_task,
                        .modality = std::string{to_string(kind)},
                        .scores = result->scores,
                        .raw_features = result->raw_features,
                        .confidence = result->confidence,
                        .produced_at_ms = to_ms(result->produced_at)});
            }

            data.parameters = state.parameters;
            for (const auto& [name, b] : state.bounds) {
                data.bounds.emplace(name, persisted_bounds{b.min, b.max});
            }
            return data;
        }

        static graph_state apply_persisted(const persisted_graph_state& data, std::string_view origin) {
            graph_state state{};
            state.session_id = data.session_id;
            state.revision = data.revision;
            state.context.session_id = data.session_id;
            state.context.job_position = data.job_position;
            state.context.focus_weights = data.focus_weights;
            if (!try_parse_analysis_mode(data.mode, state.context.mode)) {
                throw error{"{}: invalid mode {}"_format(origin, data.mode)};
            }
            state.inputs.transcript = apply_persisted(data.transcript);
            state.inputs.audio = apply_persisted(data.audio);
            state.inputs.video = apply_persisted(data.video);

            std::vector<planned_task> entries{};
            entries.reserve(data.tasks.size());
            for (const auto& record : data.tasks) {
                task t{};
                t.id = record.id;
                if (!try_parse_task_type(record.type, t.type) || !try_parse_task_priority(record.priority, t.priority) ||
                    !try_parse_task_status(record.status, t.status)) {
                    throw error{"{}: task {} has an invalid type, priority or status"_format(origin, record.id)};
                }
                t.input_ref = record.input_ref;
                t.input_params = record.input_params;
                t.best_effort = record.best_effort;
                t.sequence = record.sequence;
                t.created_at = from_ms(record.created_at_ms);
                t.started_at = from_ms(record.started_at_ms);
                t.finished_at = from_ms(record.finished_at_ms);
                t.eligible_at = from_ms(record.eligible_at_ms);
                t.attempt_count = record.attempt_count;
                t.max_attempts = record.max_attempts;
                t.last_error = record.last_error;
                entries.push_back(planned_task{std::move(t), record.dependencies});
            }
            state.tasks = task_graph::restore(std::move(entries), data.next_sequence);

            for (const auto& record : data.results) {
                auto result = std::make_shared<analysis_result>();
                result->source_task = record.task_id;
                if (!try_parse_modality(record.modality, result->kind)) {
                    throw error{"{}: invalid result modality {}"_format(origin, record.modality)};
                }
                result->scores = record.scores;
                result->raw_features = record.raw_features;
                result->confidence = record.confidence;
                result->produced_at = from_ms(record.produced_at_ms);
                state.analysis.record(std::move(result));
            }

            state.parameters = data.parameters;
            for (const auto& [name, b] : data.bounds) {
                state.bounds.emplace(name, parameter_bounds{b.min, b.max});
            }
            state.feedback = build_report(state);
            return state;
        }

        static void validate_session_id(std::string_view session_id) {
            if (session_id.empty() || session_id == "."sv || session_id == ".."sv ||
                session_id.find_first_of("/\\"sv) != std::string_view::npos) {
                throw error{"invalid session id for storage: '{}'"_format(session_id)};
            }
        }

        static std::optional<uint64_t> revision_of(const fs::path& file) {
            if (file.extension() != ".json") {
                return std::nullopt;
            }
            return utils::parse_arithmetic<uint64_t>(file.stem().string());
        }

    }  // namespace detail

    std::string encode_snapshot(const graph_state& state) {
        return internal::to_json(detail::make_persisted(state), state.session_id);
    }

    graph_state decode_snapshot(std::string_view json, std::string_view origin) {
        auto data = internal::from_json(internal::persisted_graph_state{}, json, origin);
        internal::validate_supported_schema_version(data.schema_version, origin);
        return detail::apply_persisted(data, origin);
    }

    directory_snapshot_store::directory_snapshot_store(std::filesystem::path root) : root_{std::move(root)} {
        std::error_code ec{};
        std::filesystem::create_directories(root_ / "sessions", ec);
        if (ec) {
            throw error{"failed to create snapshot directory {}: {}"_format((root_ / "sessions").string(), ec.message())};
        }
    }

    std::filesystem::path directory_snapshot_store::session_dir(std::string_view session_id) const {
        detail::validate_session_id(session_id);
        return root_ / "sessions" / std::string{session_id};
    }

    void directory_snapshot_store::put(const graph_state& state) {
        auto dir = session_dir(state.session_id);
        std::lock_guard lock{mutex_};
        std::error_code ec{};
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw error{"failed to create {}: {}"_format(dir.string(), ec.message())};
        }
        internal::write_json_file(detail::make_persisted(state), dir / "{}.json"_format(state.revision));
    }

    std::optional<graph_state> directory_snapshot_store::get(std::string_view session_id, uint64_t revision) const {
        auto path = session_dir(session_id) / "{}.json"_format(revision);
        std::lock_guard lock{mutex_};
        if (!std::filesystem::exists(path)) {
            return std::nullopt;
        }
        return decode_snapshot(internal::read_text_file(path), path.string());
    }

    std::vector<uint64_t> directory_snapshot_store::revisions(std::string_view session_id) const {
        auto dir = session_dir(session_id);
        std::lock_guard lock{mutex_};
        std::vector<uint64_t> out{};
        std::error_code ec{};
        if (!std::filesystem::is_directory(dir, ec)) {
            return out;
        }
        for (const auto& entry : std::filesystem::directory_iterator{dir}) {
            if (entry.is_regular_file()) {
                if (auto rev = detail::revision_of(entry.path())) {
                    out.push_back(*rev);
                }
            }
        }
        std::ranges::sort(out);
        return out;
    }

    std::vector<std::string> directory_snapshot_store::sessions() const {
        std::lock_guard lock{mutex_};
        std::vector<std::string> out{};
        for (const auto& entry : std::filesystem::directory_iterator{root_ / "sessions"}) {
            if (entry.is_directory()) {
                out.push_back(entry.path().filename().string());
            }
        }
        std::ranges::sort(out);
        return out;
    }

    void directory_snapshot_store::remove_session(std::string_view session_id) {
        auto dir = session_dir(session_id);
        std::lock_guard lock{mutex_};
        std::error_code ec{};
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            throw error{"failed to remove {}: {}"_format(dir.string(), ec.message())};
        }
    }

    void directory_snapshot_store::truncate_after(std::string_view session_id, uint64_t revision) {
        for (auto rev : revisions(session_id)) {
            if (rev <= revision) {
                continue;
            }
            auto path = session_dir(session_id) / "{}.json"_format(rev);
            std::lock_guard lock{mutex_};
            std::error_code ec{};
            std::filesystem::remove(path, ec);
            if (ec) {
                throw error{"failed to remove {}: {}"_format(path.string(), ec.message())};
            }
        }
    }

    void memory_snapshot_store::put(const graph_state& state) {
        auto json = encode_snapshot(state);
        std::lock_guard lock{mutex_};
        documents_[state.session_id].insert_or_assign(state.revision, std::move(json));
        ++put_count_;
    }

    std::optional<graph_state> memory_snapshot_store::get(std::string_view session_id, uint64_t revision) const {
        std::string json{};
        {
            std::lock_guard lock{mutex_};
            auto session = documents_.find(session_id);
            if (session == documents_.end()) {
                return std::nullopt;
            }
            auto doc = session->second.find(revision);
            if (doc == session->second.end()) {
                return std::nullopt;
            }
            json = doc->second;
        }
        return decode_snapshot(json, "{}#{}"_format(session_id, revision));
    }

    std::vector<uint64_t> memory_snapshot_store::revisions(std::string_view session_id) const {
        std::lock_guard lock{mutex_};
        std::vector<uint64_t> out{};
        if (auto session = documents_.find(session_id); session != documents_.end()) {
            for (const auto& [rev, _] : session->second) {
                out.push_back(rev);
            }
        }
        return out;
    }

    std::vector<std::string> memory_snapshot_store::sessions() const {
        std::lock_guard lock{mutex_};
        std::vector<std::string> out{};
        for (const auto& [id, _] : documents_) {
            out.push_back(id);
        }
        return out;
    }

    void memory_snapshot_store::remove_session(std::string_view session_id) {
        std::lock_guard lock{mutex_};
        if (auto session = documents_.find(session_id); session != documents_.end()) {
            documents_.erase(session);
        }
    }

    void memory_snapshot_store::truncate_after(std::string_view session_id, uint64_t revision) {
        std::lock_guard lock{mutex_};
        if (auto session = documents_.find(session_id); session != documents_.end()) {
            auto& docs = session->second;
            docs.erase(docs.upper_bound(revision), docs.end());
        }
    }

    size_t memory_snapshot_store::put_count() const {
        std::lock_guard lock{mutex_};
        return put_count_;
    }

}  // namespace parley
