#pragma once

#include "core/utils.hpp"
#include "models/league_config.hpp"
#include "models/player.hpp"
#include "models/player_group.hpp"
#include "services/team_generator.hpp"

#include <expected>
#include <filesystem>
#include <vector>

namespace teamforge {

// JSON snapshots in and out of the command-line driver.
class roster_io {
public:
	// Accepts a bare array of players or an object with a "players" array.
	[[nodiscard]] static auto load_players(const std::filesystem::path &path) -> std::expected<std::vector<player>, type::error>;

	[[nodiscard]] static auto load_config(const std::filesystem::path &path) -> std::expected<league_config, type::error>;

	// Accepts a bare array of groups or an object with a "playerGroups" array.
	[[nodiscard]] static auto load_groups(const std::filesystem::path &path) -> std::expected<std::vector<player_group>, type::error>;

	[[nodiscard]] static auto save_result(const std::filesystem::path &path, const generation_result &result) -> std::expected<std::monostate, type::error>;

private:
	[[nodiscard]] static auto read_json(const std::filesystem::path &path) -> std::expected<nlohmann::json, type::error>;
};

} // namespace teamforge
