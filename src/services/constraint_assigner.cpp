#include "services/constraint_assigner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <ranges>

namespace teamforge {

auto to_string(generation_mode m) -> std::string_view
{
	switch (m) {
	case generation_mode::balanced:
		return "balanced";
	case generation_mode::randomized:
		return "random";
	case generation_mode::manual:
		break;
	}
	return "manual";
}

auto generation_mode_from_string(std::string_view s) -> std::optional<generation_mode>
{
	const auto key = util::normalize(s);
	if (key == "balanced")
		return generation_mode::balanced;
	if (key == "random" || key == "randomized")
		return generation_mode::randomized;
	if (key == "manual")
		return generation_mode::manual;
	return std::nullopt;
}

auto quota_achievable(const gender_breakdown &genders, std::size_t size, const league_config &config) -> bool
{
	const auto capacity = static_cast<long long>(config.max_team_size);
	const auto remaining = capacity - static_cast<long long>(size);
	if (remaining < 0)
		return false;
	return genders.female + remaining >= config.min_females && genders.male + remaining >= config.min_males;
}

auto gender_mix_allowed(const gender_breakdown &genders, const league_config &config) -> bool
{
	return config.allow_mixed_gender || genders.male == 0 || genders.female == 0;
}

constraint_assigner::constraint_assigner(const league_config &config, const avoid_graph &avoids, std::mt19937_64 &rng, log_sink log)
		: config_(config), avoids_(avoids), rng_(rng), log_(std::move(log))
{
}

auto constraint_assigner::build_units(std::span<const player> roster, std::span<const player_group> custom, std::span<const player_group> formed)
		-> std::vector<placement_unit>
{
	std::unordered_map<std::string_view, std::size_t> index_of;
	for (std::size_t i = 0; i < roster.size(); ++i)
		index_of.emplace(roster[i].id, i);

	std::vector<bool> claimed(roster.size(), false);
	std::vector<placement_unit> units;

	const auto to_unit = [&](const player_group &g, int priority, std::size_t source) -> std::optional<placement_unit> {
		placement_unit unit{.priority = priority, .group_id = g.id, .source = source};
		for (const auto &id : g.player_ids) {
			auto it = index_of.find(id);
			if (it == index_of.end() || claimed[it->second] || std::ranges::contains(unit.members, it->second))
				continue;
			unit.members.push_back(it->second);
		}
		if (unit.members.empty())
			return std::nullopt;
		return unit;
	};

	// Priority 1: custom groups
	for (std::size_t k = 0; k < custom.size(); ++k) {
		if (auto unit = to_unit(custom[k], 1, k)) {
			for (auto m : unit->members)
				claimed[m] = true;
			units.push_back(std::move(*unit));
		}
	}

	// Priority 2: formed groups untouched by a custom group
	for (std::size_t k = 0; k < formed.size(); ++k) {
		const auto &g = formed[k];
		const bool overlaps = std::ranges::any_of(g.player_ids, [&](const std::string &id) {
			auto it = index_of.find(id);
			return it != index_of.end() && claimed[it->second];
		});
		if (overlaps)
			continue;
		if (auto unit = to_unit(g, 2, k)) {
			for (auto m : unit->members)
				claimed[m] = true;
			units.push_back(std::move(*unit));
		}
	}

	// Priority 3: everyone else
	for (std::size_t i = 0; i < roster.size(); ++i) {
		if (!claimed[i])
			units.push_back({.members = {i}, .priority = 3});
	}

	for (auto &unit : units) {
		unit.avoid_count = std::ranges::fold_left(unit.members | std::views::transform([&](std::size_t m) { return roster[m].avoid_requests.size(); }),
																							std::size_t{0}, std::plus{});
	}
	return units;
}

auto constraint_assigner::feasible(std::span<const player> roster, const slot &s, const placement_unit &unit) const -> bool
{
	const auto new_size = s.members.size() + unit.size();
	if (new_size > static_cast<std::size_t>(std::max(config_.max_team_size, 0)))
		return false;

	auto genders = s.genders;
	for (auto m : unit.members)
		genders.add(roster[m].gender);

	if (!quota_achievable(genders, new_size, config_) || !gender_mix_allowed(genders, config_))
		return false;

	// avoid pairs, either direction; a unit that carries one inside can never be placed
	for (std::size_t a = 0; a < unit.members.size(); ++a) {
		const auto &id = roster[unit.members[a]].id;
		for (auto other : s.members) {
			if (avoids_.conflicts(id, roster[other].id))
				return false;
		}
		for (std::size_t b = a + 1; b < unit.members.size(); ++b) {
			if (avoids_.conflicts(id, roster[unit.members[b]].id))
				return false;
		}
	}
	return true;
}

auto constraint_assigner::put(std::span<const player> roster, slot &s, const placement_unit &unit) -> void
{
	for (auto m : unit.members) {
		s.members.push_back(m);
		s.genders.add(roster[m].gender);
		s.total_skill += roster[m].effective_skill();
	}
}

auto constraint_assigner::place_balanced(std::span<const player> roster, std::vector<placement_unit> units, std::vector<slot> &slots) -> void
{
	// Most constrained first
	std::ranges::stable_sort(units, std::greater{}, &placement_unit::avoid_count);

	const double mean = roster.empty() ? 0.0
																		 : std::ranges::fold_left(roster | std::views::transform([](const player &p) { return p.effective_skill(); }), 0.0,
																															std::plus{}) /
																					 static_cast<double>(roster.size());

	for (const auto &unit : units) {
		std::optional<std::size_t> best;
		double best_distance = std::numeric_limits<double>::infinity();

		for (std::size_t k = 0; k < slots.size(); ++k) {
			if (!feasible(roster, slots[k], unit))
				continue;

			double added = 0.0;
			for (auto m : unit.members)
				added += roster[m].effective_skill();
			const double avg = (slots[k].total_skill + added) / static_cast<double>(slots[k].members.size() + unit.size());
			const double distance = std::abs(avg - mean);

			if (!best || slots[k].members.size() < slots[*best].members.size() ||
					(slots[k].members.size() == slots[*best].members.size() && distance < best_distance)) {
				best = k;
				best_distance = distance;
			}
		}

		if (!best) {
			log(log_, log_level::warning, "No team can take a unit of {} player(s) starting with {}; left unassigned", unit.size(), roster[unit.members.front()].name);
			continue;
		}
		put(roster, slots[*best], unit);
	}
}

auto constraint_assigner::place_randomized(std::span<const player> roster, std::vector<placement_unit> units, std::vector<slot> &slots) -> void
{
	std::ranges::shuffle(units, rng_);

	std::vector<std::size_t> order(slots.size());
	std::iota(order.begin(), order.end(), 0);

	for (const auto &unit : units) {
		std::ranges::shuffle(order, rng_);
		auto it = std::ranges::find_if(order, [&](std::size_t k) { return feasible(roster, slots[k], unit); });
		if (it == order.end()) {
			log(log_, log_level::warning, "No team can take a unit of {} player(s) starting with {}; left unassigned", unit.size(), roster[unit.members.front()].name);
			continue;
		}
		put(roster, slots[*it], unit);
	}
}

auto constraint_assigner::assign(std::span<const player> roster, std::span<const placement_unit> units, generation_mode mode) -> assignment_result
{
	const auto slot_count = config_.team_count(roster.size());
	std::vector<slot> slots(slot_count);
	assignment_result result;

	if (mode == generation_mode::manual) {
		for (std::size_t k = 0; k < slot_count; ++k)
			result.teams.push_back(make_team(util::narrow<int>(k + 1)));
		for (const auto &p : roster) {
			auto copy = p;
			copy.team_id.reset();
			result.unassigned.push_back(std::move(copy));
		}
		log(log_, log_level::info, "Manual mode: {} empty team(s), {} player(s) waiting for placement", slot_count, roster.size());
		return result;
	}

	std::vector<placement_unit> working(units.begin(), units.end());
	if (mode == generation_mode::balanced)
		place_balanced(roster, std::move(working), slots);
	else
		place_randomized(roster, std::move(working), slots);

	// ---- Materialize teams from the slot assignment -------------------------
	std::vector<bool> placed(roster.size(), false);
	for (std::size_t k = 0; k < slots.size(); ++k) {
		if (slots[k].members.empty())
			continue;

		auto t = make_team(util::narrow<int>(k + 1));
		for (auto m : slots[k].members) {
			placed[m] = true;
			result.assignment.emplace(roster[m].id, t.id);
			t.players.push_back(roster[m]);
			t.players.back().team_id = t.id;
		}
		t.recompute_stats();
		result.teams.push_back(std::move(t));
	}

	for (std::size_t i = 0; i < roster.size(); ++i) {
		if (placed[i])
			continue;
		auto copy = roster[i];
		copy.team_id.reset();
		result.unassigned.push_back(std::move(copy));
	}

	log(log_, log_level::info, "Placed {} of {} player(s) into {} team(s) ({} mode)", roster.size() - result.unassigned.size(), roster.size(),
			result.teams.size(), to_string(mode));
	return result;
}

} // namespace teamforge
