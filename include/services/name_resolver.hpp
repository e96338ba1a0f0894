/**
 * @brief
 * Fuzzy resolution of free-text name references against roster names.
 * Responsibilities:
 *   - Score a single (input, candidate) pair through a fixed cascade of checks
 *   - Rank and cache candidate lists per (input, candidates, threshold)
 *   - Turn a confidence tier into a resolution decision (accept / review / suggest / drop)
 */

#pragma once

#include "core/constants.hpp"
#include "core/logging.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace teamforge {

enum class match_confidence { exact, high, medium, low };

[[nodiscard]] auto to_string(match_confidence c) -> std::string_view;

struct match_result {
	std::string match; // the candidate as given
	double score{};		 // 0..1, 1 = exact
	match_confidence confidence{match_confidence::low};
	std::string reason;
};

enum class resolution_status { accepted, needs_review, suggestion, not_found };

[[nodiscard]] auto to_string(resolution_status s) -> std::string_view;

struct resolution {
	resolution_status status{resolution_status::not_found};
	std::optional<match_result> match{};
	std::optional<std::size_t> candidate_index{}; // index into the candidate list

	// Accepted and review-flagged matches are applied; suggestions never are.
	[[nodiscard]] auto applied(this const auto &self) -> bool
	{
		return self.status == resolution_status::accepted || self.status == resolution_status::needs_review;
	}
};

[[nodiscard]] auto levenshtein_distance(std::string_view a, std::string_view b) -> std::size_t;

// 1 - distance / max length, case-insensitive. Two empty strings are identical.
[[nodiscard]] auto levenshtein_similarity(std::string_view a, std::string_view b) -> double;

// Simplified Soundex: first letter + up to three digits, zero padded ("m242").
[[nodiscard]] auto soundex(std::string_view name) -> std::string;

class name_resolver {
public:
	explicit name_resolver(log_sink log = {});

	[[nodiscard]] auto match_single(std::string_view input, std::string_view candidate) const -> match_result;

	/**
	 * @brief Score every candidate, keep those at or above threshold, best first.
	 *        Results are memoized per (input, candidates, threshold).
	 */
	[[nodiscard]] auto match(std::string_view input, std::span<const std::string> candidates, double threshold = constants::matching::default_threshold)
			-> std::vector<match_result>;

	/**
	 * @brief Apply the confidence policy to the best candidate.
	 *        exact/high -> accepted, medium -> needs_review, below threshold but
	 *        above the suggestion floor -> suggestion, otherwise not_found.
	 */
	[[nodiscard]] auto resolve(std::string_view input, std::span<const std::string> candidates, double threshold = constants::matching::default_threshold)
			-> resolution;

	[[nodiscard]] auto is_likely_match(std::string_view a, std::string_view b, double threshold = constants::matching::likely_match_threshold) const -> bool;

	[[nodiscard]] auto suggestions(std::string_view partial, std::span<const std::string> candidates,
																 std::size_t limit = constants::limits::default_suggestion_limit) -> std::vector<match_result>;

	// Register extra nickname variants for a base name, both directions.
	auto add_custom_mapping(std::string_view base_name, std::span<const std::string> variants) -> void;

	auto clear_cache() -> void;

	[[nodiscard]] auto cache_size() const noexcept -> std::size_t { return cache_.size(); }

private:
	log_sink log_;
	// lowercase variant -> related names (base name and every sibling variant)
	std::unordered_map<std::string, std::vector<std::string>> nicknames_;
	std::unordered_map<std::string, std::vector<match_result>> cache_;

	auto build_nickname_map() -> void;
	[[nodiscard]] auto variants_of(const std::string &lowered) const -> std::span<const std::string>;
	[[nodiscard]] auto check_concatenated(std::string_view input, std::string_view candidate) const -> std::optional<match_result>;
	[[nodiscard]] auto check_nickname(std::string_view input, std::string_view candidate) const -> std::optional<match_result>;
	[[nodiscard]] static auto check_similarity(std::string_view input, std::string_view candidate) -> std::optional<match_result>;
	[[nodiscard]] static auto check_partial(std::string_view input, std::string_view candidate) -> std::optional<match_result>;
};

} // namespace teamforge
