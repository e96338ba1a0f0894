#pragma once

#include "models/player.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <functional>
#include <numeric>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace teamforge {

struct gender_breakdown {
	int male{};
	int female{};
	int other{};

	[[nodiscard]] auto operator==(const gender_breakdown &) const -> bool = default;

	[[nodiscard]] auto count(this const auto &self, gender g) -> int
	{
		switch (g) {
		case gender::male:
			return self.male;
		case gender::female:
			return self.female;
		case gender::other:
			break;
		}
		return self.other;
	}

	auto add(gender g, int delta = 1) -> void
	{
		switch (g) {
		case gender::male:
			male += delta;
			break;
		case gender::female:
			female += delta;
			break;
		case gender::other:
			other += delta;
			break;
		}
	}
};

/**
 * @brief A team and its derived stats.
 *        average_skill, genders and handler_count are recomputed by every
 *        member-changing operation below; code that edits `players` directly
 *        must call recompute_stats() before reading them.
 */
class team {
public:
	std::string id;
	std::string name;
	std::vector<player> players;
	double average_skill{};
	gender_breakdown genders{};
	int handler_count{};

	[[nodiscard]] auto total_skill(this const auto &self) -> double
	{
		return std::ranges::fold_left(self.players | std::views::transform([](const player &p) { return p.effective_skill(); }), 0.0, std::plus{});
	}

	auto recompute_stats() -> void
	{
		genders = {};
		handler_count = 0;
		for (const auto &p : players) {
			genders.add(p.gender);
			if (p.handler())
				++handler_count;
		}
		average_skill = players.empty() ? 0.0 : total_skill() / static_cast<double>(players.size());
	}

	auto add_player(player p) -> void
	{
		p.team_id = id;
		players.push_back(std::move(p));
		recompute_stats();
	}

	// Removes and returns the player; team_id on the returned copy is cleared.
	auto remove_player(std::string_view player_id) -> std::optional<player>
	{
		auto it = std::ranges::find(players, player_id, &player::id);
		if (it == players.end())
			return std::nullopt;

		player out = std::move(*it);
		players.erase(it);
		out.team_id.reset();
		recompute_stats();
		return out;
	}

	[[nodiscard]] auto contains(this const auto &self, std::string_view player_id) -> bool
	{
		return std::ranges::find(self.players, player_id, &player::id) != self.players.end();
	}

	[[nodiscard]] auto size(this const auto &self) -> std::size_t { return self.players.size(); }

	[[nodiscard]] auto empty(this const auto &self) -> bool { return self.players.empty(); }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json out{{"id", self.id},
											 {"name", self.name},
											 {"averageSkill", self.average_skill},
											 {"genderBreakdown", {{"M", self.genders.male}, {"F", self.genders.female}, {"Other", self.genders.other}}},
											 {"handlerCount", self.handler_count},
											 {"players", nlohmann::json::array()}};
		for (const auto &p : self.players)
			out["players"].push_back(p.to_json());
		return out;
	}
};

[[nodiscard]] inline auto make_team(int number) -> team
{
	team t;
	t.id = std::format("team-{}", number);
	t.name = std::format("Team {}", number);
	return t;
}

} // namespace teamforge
