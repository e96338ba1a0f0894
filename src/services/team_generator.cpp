#include "core/constants.hpp"
#include "services/stats_collector.hpp"
#include "services/team_generator.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <random>
#include <ranges>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>

namespace teamforge {

auto generation_result::to_json() const -> nlohmann::json
{
	nlohmann::json out{{"mode", std::string{to_string(mode)}},
										 {"seed", seed},
										 {"config", config.to_json()},
										 {"teams", nlohmann::json::array()},
										 {"unassignedPlayers", nlohmann::json::array()},
										 {"playerGroups", nlohmann::json::array()},
										 {"conflicts", nlohmann::json::array()},
										 {"nearMisses", nlohmann::json::array()},
										 {"warnings", nlohmann::json::array()},
										 {"stats", stats.to_json()},
										 {"balance", nullptr}};
	for (const auto &t : teams)
		out["teams"].push_back(t.to_json());
	for (const auto &p : unassigned)
		out["unassignedPlayers"].push_back(p.to_json());
	for (const auto &g : groups)
		out["playerGroups"].push_back(g.to_json());
	for (const auto &c : conflicts)
		out["conflicts"].push_back(c.to_json());
	for (const auto &n : near_misses)
		out["nearMisses"].push_back(n.to_json());
	for (const auto &w : warnings)
		out["warnings"].push_back(w.to_json());
	if (balance)
		out["balance"] = balance->to_json();
	return out;
}

team_generator::team_generator(generation_options options) : options_(std::move(options)), resolver_(options_.log) {}

// rng: if no seed provided, hash player ids (sorted) ^ mixed wall-clock
auto team_generator::make_seed(std::span<const player> roster) -> std::uint64_t
{
	std::uint64_t h = 1469598103934665603ull; // FNV offset
	std::vector<std::uint64_t> ids;
	ids.reserve(roster.size());
	for (const auto &p : roster)
		ids.push_back(std::hash<std::string>{}(p.id));
	std::ranges::sort(ids);
	for (auto x : ids) {
		h ^= x;
		h *= 1099511628211ull;
	}
	auto t = static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
	// xorshift/murmur-ish mix
	t ^= t >> 33;
	t *= 0xff51afd7ed558ccdULL;
	t ^= t >> 33;
	t *= 0xc4ceb9fe1a85ec53ULL;
	t ^= t >> 33;
	return h ^ t;
}

// Unordered pairs: A->B and B->A across the same avoid link count once.
auto team_generator::count_avoid_conflicts(std::span<const request_conflict> conflicts) -> std::size_t
{
	std::set<std::pair<std::string, std::string>> pairs;
	for (const auto &c : conflicts) {
		if (c.type != conflict_type::avoid_vs_request)
			continue;
		auto [lo, hi] = std::minmax(c.requester_id, c.target_id);
		pairs.emplace(lo, hi);
	}
	return pairs.size();
}

auto team_generator::generate(std::span<const player> roster, const league_config &config, std::span<const player_group> custom_groups)
		-> generation_result
{
	const auto start = std::chrono::steady_clock::now();

	generation_result result;
	result.config = config;
	result.mode = options_.mode;
	result.avoids = avoid_graph::build(roster, resolver_, options_.match_threshold);

	// ---- Groups --------------------------------------------------------------
	group_formation formation(resolver_, result.avoids, options_.log, options_.match_threshold);
	auto formed = formation.process_mutual_requests(roster);
	result.conflicts = std::move(formed.conflicts);
	result.near_misses = std::move(formed.near_misses);
	result.warnings = std::move(formed.warnings);

	const auto units = constraint_assigner::build_units(formed.players, custom_groups, formed.groups);

	// Only groups that became placement units survive. Units point back at their
	// source list by index; formed groups are renumbered after the custom ones,
	// skipping any id a custom group already uses.
	std::unordered_set<std::string> taken;
	for (const auto &g : custom_groups)
		taken.insert(g.id);

	const auto fresh_id = [&](std::size_t from) {
		auto id = group_id(from);
		while (taken.contains(id))
			id = group_id(++from);
		return id;
	};

	std::vector<player> working = std::move(formed.players);
	for (auto &p : working)
		p.group_id.reset();

	const auto keep = [&](player_group g, const placement_unit &unit) {
		g.player_ids.clear();
		g.players.clear();
		for (auto m : unit.members) {
			working[m].group_id = g.id;
			g.player_ids.push_back(working[m].id);
		}
		for (auto m : unit.members)
			g.players.push_back(working[m]);
		result.groups.push_back(std::move(g));
	};

	std::unordered_set<std::string> kept_ids;
	for (const auto &unit : units) {
		if (!unit.source)
			continue;

		const auto index = result.groups.size();
		player_group g;
		if (unit.priority == 1) {
			g = custom_groups[*unit.source];
			if (kept_ids.contains(g.id))
				g.id = fresh_id(index);
			if (g.label.empty())
				g.label = group_label(index);
			if (g.color.empty())
				g.color = std::string{group_color(index)};
		}
		else {
			g = {.id = fresh_id(index), .label = group_label(index), .color = std::string{group_color(index)}};
		}
		taken.insert(g.id);
		kept_ids.insert(g.id);
		keep(std::move(g), unit);
	}

	// ---- Placement -----------------------------------------------------------
	result.seed = options_.seed ? options_.seed : make_seed(roster);
	std::mt19937_64 rng{result.seed};

	constraint_assigner assigner(result.config, result.avoids, rng, options_.log);
	auto placed = assigner.assign(working, units, options_.mode);
	result.teams = std::move(placed.teams);
	result.unassigned = std::move(placed.unassigned);

	if (options_.mode == generation_mode::balanced) {
		skill_balancer balancer(result.config, result.avoids, options_.balance, options_.log);
		result.balance = balancer.balance(result.teams);
	}

	result.roster = std::move(working);

	// ---- Stats ---------------------------------------------------------------
	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	result.stats = stats_collector{resolver_}.collect(result.roster, result.teams, result.unassigned, result.groups, result.avoids,
																										count_avoid_conflicts(result.conflicts), elapsed);

	log(options_.log, log_level::info, "Generated {} team(s) for {} player(s): {} assigned, {} unassigned, {} group(s)", result.teams.size(), roster.size(),
			result.stats.assigned_players, result.stats.unassigned_players, result.groups.size());
	return result;
}

auto team_generator::refresh_stats(generation_result &result) -> void
{
	result.stats = stats_collector{resolver_}.collect(result.roster, result.teams, result.unassigned, result.groups, result.avoids,
																										count_avoid_conflicts(result.conflicts), result.stats.generation_time);
}

namespace {

auto team_of(const generation_result &result, std::string_view player_id) -> std::optional<std::string_view>
{
	for (const auto &t : result.teams) {
		if (t.contains(player_id))
			return std::string_view{t.id};
	}
	return std::nullopt;
}

auto is_known(const generation_result &result, std::string_view player_id) -> bool
{
	return team_of(result, player_id) || std::ranges::find(result.unassigned, player_id, &player::id) != result.unassigned.end();
}

} // namespace

auto team_generator::relocate(generation_result &result, std::string_view player_id, std::optional<std::string_view> target_team_id) -> void
{
	std::optional<player> moving;
	for (auto &t : result.teams) {
		if ((moving = t.remove_player(player_id)))
			break;
	}
	if (!moving) {
		auto it = std::ranges::find(result.unassigned, player_id, &player::id);
		if (it == result.unassigned.end())
			return;
		moving = std::move(*it);
		result.unassigned.erase(it);
	}

	if (target_team_id) {
		if (auto *dest = result.find_team(*target_team_id)) {
			dest->add_player(std::move(*moving));
			return;
		}
	}
	moving->team_id.reset();
	result.unassigned.push_back(std::move(*moving));
}

auto team_generator::move_player(generation_result &result, std::string_view player_id, std::optional<std::string_view> target_team_id, bool force)
		-> std::expected<type::ok_t, type::error>
{
	if (!is_known(result, player_id))
		return std::unexpected(type::error{constants::text::unknown_player});

	const auto source = team_of(result, player_id);

	if (target_team_id) {
		const auto *dest = result.find_team(*target_team_id);
		if (!dest)
			return std::unexpected(type::error{constants::text::unknown_team});
		if (source == dest->id)
			return type::ok_t{};
		if (dest->size() >= static_cast<std::size_t>(std::max(result.config.max_team_size, 0)))
			return std::unexpected(type::error{constants::text::team_full});
		if (result.avoids.conflicts_with_any(player_id, dest->players))
			return std::unexpected(type::error{constants::text::avoid_conflict});
	}
	else if (!source) {
		return type::ok_t{};
	}

	if (!force) {
		if (const auto *g = find_player_group(result.groups, player_id); g && g->size() > 1) {
			const bool splits = std::ranges::any_of(g->player_ids, [&](const std::string &id) { return id != player_id && team_of(result, id) != target_team_id; });
			if (splits)
				return std::unexpected(type::error{constants::text::group_split});
		}
	}

	relocate(result, player_id, target_team_id);
	refresh_stats(result);
	log(options_.log, log_level::info, "Moved {} to {}", player_id, target_team_id.value_or("unassigned"));
	return type::ok_t{};
}

auto team_generator::move_group(generation_result &result, std::string_view group_id, std::optional<std::string_view> target_team_id)
		-> std::expected<type::ok_t, type::error>
{
	auto git = std::ranges::find(result.groups, group_id, &player_group::id);
	if (git == result.groups.end())
		return std::unexpected(type::error{constants::text::unknown_group});
	const auto members = git->player_ids;

	if (target_team_id) {
		const auto *dest = result.find_team(*target_team_id);
		if (!dest)
			return std::unexpected(type::error{constants::text::unknown_team});

		const auto incoming = std::ranges::count_if(members, [&](const std::string &id) { return !dest->contains(id); });
		if (dest->size() + static_cast<std::size_t>(incoming) > static_cast<std::size_t>(std::max(result.config.max_team_size, 0)))
			return std::unexpected(type::error{constants::text::team_full});

		for (const auto &p : dest->players) {
			if (std::ranges::contains(members, p.id))
				continue;
			if (result.avoids.conflicts_with_any(p.id, members))
				return std::unexpected(type::error{constants::text::avoid_conflict});
		}
	}

	for (const auto &id : members) {
		if (team_of(result, id) != target_team_id)
			relocate(result, id, target_team_id);
	}

	refresh_stats(result);
	log(options_.log, log_level::info, "Moved group {} ({} player(s)) to {}", git->label, members.size(), target_team_id.value_or("unassigned"));
	return type::ok_t{};
}

} // namespace teamforge
