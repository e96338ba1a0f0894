#include "core/constants.hpp"
#include "services/stats_collector.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <unordered_map>

namespace teamforge {

auto stats_collector::count_avoid_violations(std::span<const team> teams, const avoid_graph &avoids) -> std::size_t
{
	std::size_t violations = 0;
	for (const auto &t : teams) {
		for (std::size_t i = 0; i < t.players.size(); ++i) {
			for (std::size_t j = i + 1; j < t.players.size(); ++j) {
				if (avoids.conflicts(t.players[i].id, t.players[j].id))
					++violations;
			}
		}
	}
	return violations;
}

auto stats_collector::collect(std::span<const player> roster, std::span<const team> teams, std::span<const player> unassigned,
															std::span<const player_group> groups, const avoid_graph &avoids, std::size_t conflicts_detected,
															std::chrono::milliseconds duration) -> generation_stats
{
	generation_stats stats;
	stats.total_players = roster.size();
	stats.unassigned_players = unassigned.size();
	stats.conflicts_detected = conflicts_detected;
	stats.generation_time = duration;

	std::unordered_map<std::string, std::string> team_of;
	for (const auto &t : teams) {
		stats.assigned_players += t.size();
		for (const auto &p : t.players)
			team_of.emplace(p.id, t.id);
	}

	const auto same_team = [&](const std::string &a, const std::string &b) {
		auto ia = team_of.find(a);
		auto ib = team_of.find(b);
		return ia != team_of.end() && ib != team_of.end() && ia->second == ib->second;
	};

	// ---- Requests ------------------------------------------------------------
	const auto names = roster | std::views::transform(&player::name) | std::ranges::to<std::vector<std::string>>();

	for (const auto &p : roster) {
		for (std::size_t k = 0; k < p.teammate_requests.size(); ++k) {
			const auto res = resolver_.resolve(p.teammate_requests[k], names, constants::matching::stats_threshold);
			if (!res.applied() || !res.candidate_index)
				continue;

			const auto &target = roster[*res.candidate_index];
			if (target.id == p.id)
				continue;

			const bool honored = same_team(p.id, target.id);
			if (priority_for_index(k) == request_priority::must_have)
				++(honored ? stats.must_have_honored : stats.must_have_broken);
			else
				++(honored ? stats.nice_to_have_honored : stats.nice_to_have_broken);
		}
	}

	// ---- Groups --------------------------------------------------------------
	// A group left wholly unassigned is still atomic.
	for (const auto &g : groups) {
		const bool together = !g.player_ids.empty() && std::ranges::all_of(g.player_ids, [&](const std::string &id) { return same_team(g.player_ids.front(), id); });
		const bool all_out = std::ranges::none_of(g.player_ids, [&](const std::string &id) { return team_of.contains(id); });
		++(together || all_out ? stats.groups_intact : stats.groups_broken);
	}

	stats.avoid_violations = count_avoid_violations(teams, avoids);
	return stats;
}

} // namespace teamforge
