#pragma once

#include "graph_state.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

    // Serialized snapshot document (schema_version 1). Feedback is derived and not stored.
    std::string encode_snapshot(const graph_state& state);

    // Throws parley::error on malformed documents, unknown enum tokens, or a newer schema_version.
    graph_state decode_snapshot(std::string_view json, std::string_view origin = "<memory>"sv);

    // Durable store addressed by session_id#revision. Implementations are thread-safe.
    class snapshot_store {
      public:
        virtual ~snapshot_store() = default;

        virtual void put(const graph_state& state) = 0;
        virtual std::optional<graph_state> get(std::string_view session_id, uint64_t revision) const = 0;
        virtual std::vector<uint64_t> revisions(std::string_view session_id) const = 0;
        virtual std::vector<std::string> sessions() const = 0;
        virtual void remove_session(std::string_view session_id) = 0;

        // Drops snapshots newer than `revision`; used when a session is rolled back.
        virtual void truncate_after(std::string_view session_id, uint64_t revision) = 0;

        std::optional<uint64_t> latest_revision(std::string_view session_id) const {
            auto all = revisions(session_id);
            if (all.empty()) {
                return std::nullopt;
            }
            return all.back();
        }

        std::optional<graph_state> latest(std::string_view session_id) const {
            auto rev = latest_revision(session_id);
            if (!rev) {
                return std::nullopt;
            }
            return get(session_id, *rev);
        }
    };

    // <root>/sessions/<session_id>/<revision>.json, written atomically.
    class directory_snapshot_store final : public snapshot_store {
      public:
        explicit directory_snapshot_store(std::filesystem::path root);

        void put(const graph_state& state) override;
        std::optional<graph_state> get(std::string_view session_id, uint64_t revision) const override;
        std::vector<uint64_t> revisions(std::string_view session_id) const override;
        std::vector<std::string> sessions() const override;
        void remove_session(std::string_view session_id) override;
        void truncate_after(std::string_view session_id, uint64_t revision) override;

        const std::filesystem::path& root() const { return root_; }
        std::filesystem::path session_dir(std::string_view session_id) const;

      private:
        std::filesystem::path root_;
        mutable std::mutex mutex_;
    };

    // Keeps encoded documents, so tests exercise the same codec as the directory store.
    class memory_snapshot_store final : public snapshot_store {
      public:
        void put(const graph_state& state) override;
        std::optional<graph_state> get(std::string_view session_id, uint64_t revision) const override;
        std::vector<uint64_t> revisions(std::string_view session_id) const override;
        std::vector<std::string> sessions() const override;
        void remove_session(std::string_view session_id) override;
        void truncate_after(std::string_view session_id, uint64_t revision) override;

        size_t put_count() const;

      private:
        mutable std::mutex mutex_;
        std::map<std::string, std::map<uint64_t, std::string>, std::less<>> documents_;
        size_t put_count_{};
    };

}  // namespace parley
