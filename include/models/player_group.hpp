#pragma once

#include "core/constants.hpp"
#include "models/player.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace teamforge {

class player_group {
public:
	std::string id;
	std::string label; // A, B, C, ...
	std::string color;
	std::vector<std::string> player_ids;
	std::vector<player> players;

	[[nodiscard]] auto size(this const auto &self) -> std::size_t { return self.player_ids.size(); }

	[[nodiscard]] auto contains(this const auto &self, std::string_view player_id) -> bool { return std::ranges::find(self.player_ids, player_id) != self.player_ids.end(); }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json out{{"id", self.id}, {"label", self.label}, {"color", self.color}, {"playerIds", self.player_ids}, {"players", nlohmann::json::array()}};
		for (const auto &p : self.players)
			out["players"].push_back(p.to_json());
		return out;
	}

	// Only ids are required; `players` is hydrated by the caller from its roster.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> player_group
	{
		player_group g;
		g.id = j.at("id").get<std::string>();
		g.label = j.value("label", std::string{});
		g.color = j.value("color", std::string{});
		g.player_ids = j.at("playerIds").get<std::vector<std::string>>();
		if (auto it = j.find("players"); it != j.end() && it->is_array()) {
			for (const auto &pj : *it)
				g.players.push_back(player::from_json(pj));
		}
		return g;
	}
};

// Spreadsheet-style: 0 -> A, 25 -> Z, 26 -> AA, 27 -> AB, ...
[[nodiscard]] inline auto group_label(std::size_t index) -> std::string
{
	std::string label;
	std::size_t n = index + 1;
	while (n > 0) {
		--n;
		label.insert(label.begin(), static_cast<char>('A' + n % 26));
		n /= 26;
	}
	return label;
}

[[nodiscard]] inline auto group_color(std::size_t index) -> std::string_view { return constants::group_colors[index % constants::group_colors.size()]; }

[[nodiscard]] inline auto group_id(std::size_t index) -> std::string { return std::format("group-{}", index); }

} // namespace teamforge
