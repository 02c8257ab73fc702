#pragma once

#include "parley/errors.hpp"
#include "parley/format.hpp"
#include "types.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace parley::internal {

    namespace fs = std::filesystem;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw error{"failed to open " + path.string()};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw error{"failed to read " + path.string()};
        }
        return ss.str();
    }

    template <typename T>
    std::string to_json(const T& value, std::string_view what) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw error{std::format("failed to serialize json for {}", what)};
        }
        return json;
    }

    template <typename T>
    T from_json(T value, std::string_view json, std::string_view origin) {
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
        if (ec) {
            throw error{std::format("failed to parse json from {}: {}", origin, glz::format_error(ec, json))};
        }
        return value;
    }

    // Writes to a sibling temp file and renames it over the target, so readers never see a torn file.
    template <typename T>
    void write_json_file(const T& value, const fs::path& path) {
        auto json = to_json(value, path.string());

        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out{tmp, std::ios::trunc};
            if (!out) {
                throw error{std::format("failed to open {}", tmp.string())};
            }
            out << json << '\n';
            out.flush();
            if (!out) {
                throw error{std::format("failed to write {}", tmp.string())};
            }
        }

        std::error_code ec{};
        fs::rename(tmp, path, ec);
        if (ec) {
            fs::remove(tmp, ec);
            throw error{std::format("failed to replace {}", path.string())};
        }
    }

    template <typename T>
    T read_json_file(const fs::path& path, T defaults = T{}) {
        return from_json(std::move(defaults), read_text_file(path), path.string());
    }

    inline void validate_supported_schema_version(int schema_version, std::string_view origin) {
        if (schema_version > supported_schema_version) {
            throw error{std::format(
                    "unsupported schema_version in {}: {} > {}", origin, schema_version, supported_schema_version)};
        }
    }

}  // namespace parley::internal
