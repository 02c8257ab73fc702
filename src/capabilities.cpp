#include "parley/capability.hpp"

#include "parley/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <set>
#include <string_view>
#include <vector>

using namespace parley::literals;

namespace parley {
    namespace detail {

        static std::optional<double> feature(const modality_input& input, std::string_view name) {
            auto it = input.features.find(std::string{name});
            if (it == input.features.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        static double param_or(const param_map& params, std::string_view name, double fallback) {
            auto it = params.find(std::string{name});
            return it == params.end() ? fallback : it->second;
        }

        static std::string encode_features(const modality_input& input) {
            std::string json{};
            auto ec = glz::write_json(input.features, json);
            if (ec) {
                return {};
            }
            return json;
        }

        // Thresholded confidence: results that clear the modality threshold keep their full confidence.
        static double adjust_confidence(double confidence, double mean_score, double threshold) {
            if (mean_score < threshold) {
                confidence *= 0.9;
            }
            return utils::clamp_unit(confidence);
        }

        static analysis_result make_result(
                const capability_request& request, std::map<std::string, double> scores, double coverage) {
            analysis_result result{};
            result.source_task = request.task;
            result.kind = request.kind;
            result.raw_features = encode_features(request.input);
            result.produced_at = now_ms();

            auto mean = modality_score(scores).value_or(0.0);
            auto threshold = param_or(request.params, "{}.threshold"_format(request.kind), 0.7);
            result.confidence = adjust_confidence(0.5 + 0.5 * coverage, mean, threshold);
            result.scores = std::move(scores);
            return result;
        }

        // Values above 1 are taken to be on the 0..10 scale the extractors emit.
        static double normalize_score(double value) {
            return utils::clamp_unit(value > 1.0 ? value / 10.0 : value);
        }

        static double clarity_from(double spectral_centroid, double zero_crossing_rate) {
            double clarity = 5.0;
            if (spectral_centroid > 2000.0) {
                clarity += 2.0;
            }
            else if (spectral_centroid > 1500.0) {
                clarity += 1.5;
            }
            else if (spectral_centroid > 1000.0) {
                clarity += 1.0;
            }

            if (zero_crossing_rate > 0.15) {
                clarity += 1.0;
            }
            else if (zero_crossing_rate > 0.10) {
                clarity += 0.5;
            }
            return utils::clamp_unit(clarity / 10.0);
        }

        // 100..120 bpm is the comfortable band; both directions lose score symmetrically.
        static double pace_from(double tempo) {
            if (tempo > 160.0) {
                return 0.6;
            }
            if (tempo > 140.0) {
                return 0.75;
            }
            if (tempo > 120.0) {
                return 0.9;
            }
            if (tempo > 100.0) {
                return 1.0;
            }
            if (tempo > 80.0) {
                return 0.9;
            }
            if (tempo > 60.0) {
                return 0.75;
            }
            return 0.6;
        }

        static double volume_from(double rms) {
            return utils::clamp_unit(1.0 - std::abs(rms - 0.2) / 0.3);
        }

        static std::vector<std::string> words_of(std::string_view text) {
            std::vector<std::string> words{};
            std::string current{};
            for (char c : text) {
                if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
                    current.push_back(utils::char_tolower(c));
                }
                else if (!current.empty()) {
                    words.push_back(std::move(current));
                    current.clear();
                }
            }
            if (!current.empty()) {
                words.push_back(std::move(current));
            }
            return words;
        }

        static size_t sentence_count(std::string_view text) {
            size_t count = 0U;
            bool in_sentence = false;
            for (char c : text) {
                if (c == '.' || c == '!' || c == '?') {
                    if (in_sentence) {
                        ++count;
                    }
                    in_sentence = false;
                }
                else if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
                    in_sentence = true;
                }
            }
            return in_sentence ? count + 1U : count;
        }

    }  // namespace detail

    std::optional<analyzer_error> validate_params(modality m, const param_map& params) {
        auto prefix = "{}."_format(m);
        for (const auto& [name, value] : params) {
            if (!std::isfinite(value)) {
                return analyzer_error{analyzer_errc::invalid_params, "parameter {} is not finite"_format(name)};
            }
            if (!name.starts_with(prefix)) {
                continue;
            }
            auto bounded = name.ends_with("threshold"sv) || name.ends_with("sensitivity"sv);
            if (bounded && (value < 0.0 || value > 1.0)) {
                return analyzer_error{
                        analyzer_errc::invalid_params, "parameter {}={} outside [0, 1]"_format(name, value)};
            }
        }
        return std::nullopt;
    }

    analysis_outcome speech_feature_analyzer::analyze(const capability_request& request) {
        if (auto err = request.deadline.check()) {
            return std::unexpected(*err);
        }
        if (auto err = validate_params(modality::speech, request.params)) {
            return std::unexpected(*err);
        }

        const auto& input = request.input;
        auto centroid = detail::feature(input, "spectral_centroid"sv);
        auto zcr = detail::feature(input, "zero_crossing_rate"sv);
        auto tempo = detail::feature(input, "tempo"sv);
        auto rms = detail::feature(input, "rms"sv);
        auto pause_ratio = detail::feature(input, "pause_ratio"sv);

        if (!centroid && !zcr && !tempo && !rms && !pause_ratio) {
            return std::unexpected(analyzer_error{
                    analyzer_errc::input_unavailable, "no audio features for {}"_format(input.ref)});
        }

        std::map<std::string, double> scores{};
        size_t present = 0U;
        if (centroid || zcr) {
            scores["clarity"] = detail::clarity_from(centroid.value_or(0.0), zcr.value_or(0.0));
            present += static_cast<size_t>(centroid.has_value()) + static_cast<size_t>(zcr.has_value());
        }
        if (tempo) {
            scores["pace"] = detail::pace_from(*tempo);
            ++present;
        }
        if (rms) {
            scores["volume"] = detail::volume_from(*rms);
            ++present;
        }
        if (pause_ratio) {
            scores["fluency"] = utils::clamp_unit(1.0 - *pause_ratio * 1.5);
            ++present;
        }

        if (auto err = request.deadline.check()) {
            return std::unexpected(*err);
        }
        return detail::make_result(request, std::move(scores), static_cast<double>(present) / 5.0);
    }

    analysis_outcome visual_feature_analyzer::analyze(const capability_request& request) {
        if (auto err = request.deadline.check()) {
            return std::unexpected(*err);
        }
        if (auto err = validate_params(modality::visual, request.params)) {
            return std::unexpected(*err);
        }

        static constexpr std::array items{"eye_contact"sv, "facial_expression"sv, "posture"sv, "gestures"sv};

        std::map<std::string, double> scores{};
        for (auto item : items) {
            if (auto value = detail::feature(request.input, item)) {
                scores[std::string{item}] = detail::normalize_score(*value);
            }
        }
        if (scores.empty()) {
            return std::unexpected(analyzer_error{
                    analyzer_errc::input_unavailable, "no visual features for {}"_format(request.input.ref)});
        }

        auto coverage = static_cast<double>(scores.size()) / static_cast<double>(items.size());
        return detail::make_result(request, std::move(scores), coverage);
    }

    analysis_outcome content_feature_analyzer::analyze(const capability_request& request) {
        if (auto err = request.deadline.check()) {
            return std::unexpected(*err);
        }
        if (auto err = validate_params(modality::content, request.params)) {
            return std::unexpected(*err);
        }

        auto text = utils::trim_view(request.input.text);
        if (text.empty()) {
            return std::unexpected(analyzer_error{
                    analyzer_errc::input_unavailable, "no transcript text for {}"_format(request.input.ref)});
        }

        auto words = detail::words_of(text);
        auto sentences = std::max<size_t>(detail::sentence_count(text), 1U);

        std::set<std::string> vocabulary{words.begin(), words.end()};
        std::set<std::string> role_terms{};
        for (auto& term : detail::words_of(request.job_position)) {
            if (term.size() > 2U) {
                role_terms.insert(std::move(term));
            }
        }

        std::map<std::string, double> scores{};
        if (role_terms.empty()) {
            scores["relevance"] = 0.75;
        }
        else {
            size_t hits = 0U;
            for (const auto& term : role_terms) {
                hits += static_cast<size_t>(vocabulary.contains(term));
            }
            scores["relevance"] = 0.5 + 0.5 * static_cast<double>(hits) / static_cast<double>(role_terms.size());
        }

        scores["structure"] = utils::clamp_unit(0.4 + 0.15 * static_cast<double>(std::min<size_t>(sentences, 4U)));

        auto avg_sentence = static_cast<double>(words.size()) / static_cast<double>(sentences);
        scores["clarity"] = (avg_sentence >= 8.0 && avg_sentence <= 25.0) ? 0.9 : 0.6;

        auto diversity = words.empty() ? 0.0 : static_cast<double>(vocabulary.size()) / static_cast<double>(words.size());
        scores["keyword_coverage"] = utils::clamp_unit(diversity * 1.25);
        scores["depth"] = utils::clamp_unit(static_cast<double>(words.size()) / 150.0);

        if (auto err = request.deadline.check()) {
            return std::unexpected(*err);
        }
        auto coverage = utils::clamp_unit(static_cast<double>(words.size()) / 100.0);
        return detail::make_result(request, std::move(scores), coverage);
    }

    capability_set make_builtin_capabilities() {
        capability_set set{};
        set.add(std::make_shared<speech_feature_analyzer>())
                .add(std::make_shared<visual_feature_analyzer>())
                .add(std::make_shared<content_feature_analyzer>());
        return set;
    }

}  // namespace parley
