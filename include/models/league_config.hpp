#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace teamforge {

class league_config {
public:
	std::string id{constants::defaults::config_id};
	std::string name{constants::defaults::config_name};
	int max_team_size{constants::defaults::max_team_size};
	int min_females{constants::defaults::min_females};
	int min_males{constants::defaults::min_males};
	std::optional<int> target_teams{};
	bool allow_mixed_gender{true};

	/**
	 * @brief Caller-side validation; the generator itself assumes a valid config.
	 * @return ok_t, or an error whose message lists every problem found, one per line.
	 */
	[[nodiscard]] auto validate() const -> std::expected<type::ok_t, type::error>;

	[[nodiscard]] auto problems() const -> std::vector<std::string>;

	/**
	 * @brief Number of team slots for a roster: target_teams when set,
	 *        otherwise ceil(player_count / max_team_size). Never negative.
	 */
	[[nodiscard]] auto team_count(std::size_t player_count) const -> std::size_t;

	[[nodiscard]] auto to_json() const -> nlohmann::json;
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> league_config;
};

} // namespace teamforge
