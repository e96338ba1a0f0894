/**
 * @brief
 * One call in, one result out: avoid graph -> group formation -> placement ->
 * balancing -> stats. Also owns the post-generation move primitives, which keep
 * the same hard rules as generation and refresh the result's stats.
 */

#pragma once

#include "core/constants.hpp"
#include "core/logging.hpp"
#include "core/utils.hpp"
#include "models/generation_stats.hpp"
#include "models/league_config.hpp"
#include "models/player.hpp"
#include "models/player_group.hpp"
#include "models/team.hpp"
#include "services/avoid_graph.hpp"
#include "services/constraint_assigner.hpp"
#include "services/group_formation.hpp"
#include "services/name_resolver.hpp"
#include "services/skill_balancer.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace teamforge {

struct generation_options {
	generation_mode mode{generation_mode::balanced};
	std::uint64_t seed{0}; // 0 = use random seed
	balance_options balance{};
	double match_threshold{constants::matching::default_threshold};
	log_sink log{};
};

struct generation_result {
	std::vector<team> teams;
	std::vector<player> unassigned;
	std::vector<player_group> groups; // every group that was placed as a unit
	std::vector<request_conflict> conflicts;
	std::vector<near_miss_group> near_misses;
	std::vector<resolution_warning> warnings;
	generation_stats stats{};
	std::optional<balance_report> balance{};

	// State later moves and stat refreshes depend on
	std::vector<player> roster;
	league_config config{};
	avoid_graph avoids{};
	generation_mode mode{generation_mode::balanced};
	std::uint64_t seed{};

	[[nodiscard]] auto find_team(this auto &self, std::string_view team_id) -> decltype(&self.teams.front())
	{
		auto it = std::ranges::find(self.teams, team_id, &team::id);
		return it == self.teams.end() ? nullptr : &*it;
	}

	[[nodiscard]] auto to_json() const -> nlohmann::json;
};

class team_generator {
public:
	explicit team_generator(generation_options options = {});

	/**
	 * @brief Run the whole pipeline. Inputs are never modified.
	 *        The config is assumed valid; see league_config::validate().
	 */
	[[nodiscard]] auto generate(std::span<const player> roster, const league_config &config, std::span<const player_group> custom_groups = {})
			-> generation_result;

	/**
	 * @brief Move one player to a team, or back to unassigned when target is empty.
	 *        Full teams and avoid conflicts are always rejected; splitting a group
	 *        is rejected unless `force` is set.
	 */
	[[nodiscard]] auto move_player(generation_result &result, std::string_view player_id, std::optional<std::string_view> target_team_id, bool force = false)
			-> std::expected<type::ok_t, type::error>;

	// Move every member of a group together; same capacity and avoid rules.
	[[nodiscard]] auto move_group(generation_result &result, std::string_view group_id, std::optional<std::string_view> target_team_id)
			-> std::expected<type::ok_t, type::error>;

	[[nodiscard]] auto resolver() -> name_resolver & { return resolver_; }

	[[nodiscard]] auto options() const noexcept -> const generation_options & { return options_; }

private:
	generation_options options_;
	name_resolver resolver_;

	auto refresh_stats(generation_result &result) -> void;
	auto relocate(generation_result &result, std::string_view player_id, std::optional<std::string_view> target_team_id) -> void;

	[[nodiscard]] static auto make_seed(std::span<const player> roster) -> std::uint64_t;
	[[nodiscard]] static auto count_avoid_conflicts(std::span<const request_conflict> conflicts) -> std::size_t;
};

} // namespace teamforge
