#include "services/roster_io.hpp"
#include <nlohmann/json.hpp>

#include <format>
#include <fstream>

namespace teamforge {

auto roster_io::read_json(const std::filesystem::path &path) -> std::expected<nlohmann::json, type::error>
{
	if (!std::filesystem::exists(path))
		return std::unexpected(type::error{std::format("File not found: {}", path.string())});

	try { // The try block is for nlohmann::json
		std::ifstream file(path);
		nlohmann::json j;
		file >> j;
		return j;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot parse {}: {}", path.string(), e.what())});
	}
}

auto roster_io::load_players(const std::filesystem::path &path) -> std::expected<std::vector<player>, type::error>
{
	auto j = read_json(path);
	if (!j)
		return std::unexpected(j.error());

	try {
		const auto &items = j->is_object() ? j->at("players") : *j;
		if (!items.is_array())
			return std::unexpected(type::error{std::format("{}: expected an array of players", path.string())});

		std::vector<player> players;
		players.reserve(items.size());
		for (const auto &item : items)
			players.push_back(player::from_json(item));
		return players;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot load players: {}", e.what())});
	}
}

auto roster_io::load_config(const std::filesystem::path &path) -> std::expected<league_config, type::error>
{
	auto j = read_json(path);
	if (!j)
		return std::unexpected(j.error());

	try {
		return league_config::from_json(*j);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot load config: {}", e.what())});
	}
}

auto roster_io::load_groups(const std::filesystem::path &path) -> std::expected<std::vector<player_group>, type::error>
{
	auto j = read_json(path);
	if (!j)
		return std::unexpected(j.error());

	try {
		const auto &items = j->is_object() ? j->at("playerGroups") : *j;
		if (!items.is_array())
			return std::unexpected(type::error{std::format("{}: expected an array of groups", path.string())});

		std::vector<player_group> groups;
		for (const auto &item : items)
			groups.push_back(player_group::from_json(item));
		return groups;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot load groups: {}", e.what())});
	}
}

auto roster_io::save_result(const std::filesystem::path &path, const generation_result &result) -> std::expected<std::monostate, type::error>
{
	try { // The try block is for nlohmann::json
		std::ofstream file(path);
		if (!file)
			return std::unexpected(type::error{std::format("Cannot open {} for writing", path.string())});
		file << result.to_json().dump(2);
		return std::monostate{};
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot save result: {}", e.what())});
	}
}

} // namespace teamforge
