/**
 * @brief
 * Places placement units (groups and singletons) into a fixed number of team slots.
 * Hard rules: capacity, gender-quota achievability, avoid pairs, and the optional
 * single-gender rule. A unit is placed whole or not at all.
 */

#pragma once

#include "core/logging.hpp"
#include "models/league_config.hpp"
#include "models/player.hpp"
#include "models/player_group.hpp"
#include "models/team.hpp"
#include "services/avoid_graph.hpp"

#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace teamforge {

enum class generation_mode { balanced, randomized, manual };

[[nodiscard]] auto to_string(generation_mode m) -> std::string_view;
[[nodiscard]] auto generation_mode_from_string(std::string_view s) -> std::optional<generation_mode>;

struct placement_unit {
	std::vector<std::size_t> members; // roster indices
	int priority{3};									// 1 = custom group, 2 = formed group, 3 = singleton
	std::optional<std::string> group_id{};
	std::optional<std::size_t> source{}; // index into the custom (priority 1) or formed (priority 2) group list
	std::size_t avoid_count{};					 // sum of the members' raw avoid requests

	[[nodiscard]] auto size(this const auto &self) -> std::size_t { return self.members.size(); }
};

struct assignment_result {
	std::vector<team> teams;
	std::vector<player> unassigned;
	std::unordered_map<std::string, std::string> assignment; // player id -> team id
};

// True when the minimums can still be met by filling the team's free slots.
[[nodiscard]] auto quota_achievable(const gender_breakdown &genders, std::size_t size, const league_config &config) -> bool;

// With allow_mixed_gender off, a team may not hold both M and F players.
[[nodiscard]] auto gender_mix_allowed(const gender_breakdown &genders, const league_config &config) -> bool;

class constraint_assigner {
public:
	constraint_assigner(const league_config &config, const avoid_graph &avoids, std::mt19937_64 &rng, log_sink log = {});

	/**
	 * @brief Custom groups first, then formed groups that share no player with a
	 *        custom group, then every remaining player alone.
	 *        Ids that are not on the roster are ignored.
	 */
	[[nodiscard]] static auto build_units(std::span<const player> roster, std::span<const player_group> custom, std::span<const player_group> formed)
			-> std::vector<placement_unit>;

	[[nodiscard]] auto assign(std::span<const player> roster, std::span<const placement_unit> units, generation_mode mode) -> assignment_result;

private:
	struct slot {
		std::vector<std::size_t> members;
		gender_breakdown genders{};
		double total_skill{};
	};

	const league_config &config_;
	const avoid_graph &avoids_;
	std::mt19937_64 &rng_;
	log_sink log_;

	[[nodiscard]] auto feasible(std::span<const player> roster, const slot &s, const placement_unit &unit) const -> bool;

	auto place_balanced(std::span<const player> roster, std::vector<placement_unit> units, std::vector<slot> &slots) -> void;
	auto place_randomized(std::span<const player> roster, std::vector<placement_unit> units, std::vector<slot> &slots) -> void;

	static auto put(std::span<const player> roster, slot &s, const placement_unit &unit) -> void;
};

} // namespace teamforge
