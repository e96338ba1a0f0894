/**
 * @brief
 * Responsibilities:
 *   - Resolve every teammate request against the roster (first = must-have)
 *   - Build the reciprocal connection graph and cut it into groups of at most 4
 *   - Record what was cut (near-misses), request conflicts, and per-request outcomes
 *   - Pre-check groups against a team size before generation
 */

#pragma once

#include "core/constants.hpp"
#include "core/logging.hpp"
#include "models/player.hpp"
#include "models/player_group.hpp"
#include "services/avoid_graph.hpp"
#include "services/name_resolver.hpp"
#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace teamforge {

struct resolved_request {
	std::string requested_name;
	request_priority priority{request_priority::nice_to_have};
	resolution outcome{};
	std::optional<std::size_t> target{}; // roster index, set only for applied resolutions
};

enum class warning_category { match_exact, match_review, suggestion, not_found };

[[nodiscard]] auto to_string(warning_category c) -> std::string_view;

struct resolution_warning {
	warning_category category{warning_category::not_found};
	std::string player_name;
	std::string requested_name;
	std::optional<std::string> matched_name{};
	std::optional<match_confidence> confidence{};
	std::string message;

	[[nodiscard]] auto to_json() const -> nlohmann::json;
};

enum class conflict_type { avoid_vs_request, one_way_request };

[[nodiscard]] auto to_string(conflict_type c) -> std::string_view;

struct request_conflict {
	std::string requester_id;
	std::string target_id;
	conflict_type type{conflict_type::one_way_request};
	std::string description;

	[[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct near_miss_group {
	std::vector<std::string> player_ids;   // the group that was kept
	std::vector<std::string> excluded_ids; // reachable players cut by the size cap
	std::string reason{constants::text::group_too_large_reason};

	[[nodiscard]] auto to_json() const -> nlohmann::json;
};

/**
 * @class connection_graph
 * @brief Undirected graph over roster indices; edges are reciprocal requests only.
 */
class connection_graph {
public:
	struct component {
		std::vector<std::size_t> members;
		std::vector<std::size_t> overflow; // cut by the size cap
		std::vector<std::size_t> rejected; // incompatible with the kept members, or no longer linked to them
	};

	// May `node` join the already kept `members`?
	using compatibility = std::function<bool(std::size_t node, std::span<const std::size_t> members)>;

	explicit connection_graph(std::size_t node_count = 0) : adjacency_(node_count) {}

	auto add_edge(std::size_t a, std::size_t b) -> void;

	[[nodiscard]] auto has_edge(std::size_t a, std::size_t b) const -> bool;
	[[nodiscard]] auto neighbors(std::size_t node) const -> std::span<const std::size_t> { return adjacency_.at(node); }
	[[nodiscard]] auto size() const noexcept -> std::size_t { return adjacency_.size(); }
	[[nodiscard]] auto edge_count() const noexcept -> std::size_t { return edges_; }

	/**
	 * @brief Breadth-first discovery order of the component holding `start`,
	 *        skipping nodes already flagged in `taken`.
	 */
	[[nodiscard]] auto discover(std::size_t start, const std::vector<bool> &taken) const -> std::vector<std::size_t>;

	/**
	 * @brief Walk a discovery order and keep nodes while the group has room.
	 *        A node is kept only if it links to a kept node and passes `compatible`;
	 *        once `cap` nodes are kept the rest is overflow.
	 */
	[[nodiscard]] auto truncate(std::span<const std::size_t> order, std::size_t cap, const compatibility &compatible = {}) const -> component;

private:
	std::vector<std::vector<std::size_t>> adjacency_;
	std::size_t edges_{};
};

struct formation_result {
	std::vector<player> players; // roster copies, stamped with group_id and unfulfilled_requests
	std::vector<player_group> groups;
	std::vector<request_conflict> conflicts;
	std::vector<near_miss_group> near_misses;
	std::vector<resolution_warning> warnings;
	connection_graph graph;
};

struct group_validation {
	std::vector<std::string> errors;
	std::vector<std::string> warnings;

	[[nodiscard]] auto ok(this const auto &self) -> bool { return self.errors.empty(); }
};

class group_formation {
public:
	group_formation(name_resolver &resolver, const avoid_graph &avoids, log_sink log = {}, double threshold = constants::matching::default_threshold);

	[[nodiscard]] auto resolve_requests(std::span<const player> roster) -> std::vector<std::vector<resolved_request>>;

	/**
	 * @brief Diagnostics only: requests aimed at someone who avoids the requester,
	 *        and requests that are not returned. Neither blocks grouping.
	 */
	[[nodiscard]] auto detect_request_conflicts(std::span<const player> roster, std::span<const std::vector<resolved_request>> resolved) const
			-> std::vector<request_conflict>;

	[[nodiscard]] static auto build_graph(std::span<const std::vector<resolved_request>> resolved) -> connection_graph;

	/**
	 * @brief Full pass: resolve, detect conflicts, build reciprocal graph,
	 *        cut components at max_group_size, classify every request.
	 */
	[[nodiscard]] auto process_mutual_requests(std::span<const player> roster) -> formation_result;

private:
	name_resolver &resolver_;
	const avoid_graph &avoids_;
	log_sink log_;
	double threshold_;

	[[nodiscard]] static auto make_warning(const player &requester, const resolved_request &req) -> std::optional<resolution_warning>;
};

[[nodiscard]] auto validate_groups_for_generation(std::span<const player_group> groups, int max_team_size) -> group_validation;

[[nodiscard]] auto find_player_group(std::span<const player_group> groups, std::string_view player_id) -> const player_group *;

} // namespace teamforge
