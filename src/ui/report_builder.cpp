#include "core/constants.hpp"
#include "ui/report_builder.hpp"

#include <format>
#include <ranges>

namespace teamforge::ui {

auto report_builder::build_report(const generation_result &result) -> std::string
{
	std::string out = std::format("Teams ({} mode, seed {})\n\n", to_string(result.mode), result.seed);
	out += build_teams(result.teams);
	out += build_unassigned(result.unassigned);
	out += build_warnings(result);
	out += build_stats(result.stats);
	if (result.balance) {
		out += std::format("Balance: spread {:.2f} -> {:.2f}, {} swap(s) in {} pass(es)\n", result.balance->initial_spread, result.balance->final_spread,
											 result.balance->swaps, result.balance->passes);
	}
	return out;
}

auto report_builder::build_teams(std::span<const team> teams) -> std::string
{
	if (teams.empty())
		return "No teams.\n\n";

	std::string out;
	for (const auto &t : teams) {
		out += std::format("{} ({} players, avg {:.2f}, M {} / F {} / Other {}, handlers {})\n", t.name, t.size(), t.average_skill, t.genders.male,
											 t.genders.female, t.genders.other, t.handler_count);
		out += format_team_members(t);
		out += "\n";
	}

	// Calculate spread
	auto averages = teams | std::views::filter([](const team &t) { return !t.empty(); }) | std::views::transform(&team::average_skill);
	if (!std::ranges::empty(averages)) {
		auto [min_it, max_it] = std::ranges::minmax_element(averages);
		out += std::format("Skill spread: {:.2f}\n\n", *max_it - *min_it);
	}
	return out;
}

auto report_builder::build_unassigned(std::span<const player> players) -> std::string
{
	if (players.empty())
		return {};

	std::string out = std::format("Unassigned ({}):\n", players.size());
	for (const auto &p : players)
		out += std::format("  - {}\n", format_player(p));
	return out + "\n";
}

auto report_builder::build_warnings(const generation_result &result) -> std::string
{
	std::string out;
	for (const auto &w : result.warnings) {
		const auto prefix = w.category == warning_category::not_found ? constants::text::err_prefix : constants::text::warn_prefix;
		out += std::format("{}{}\n", prefix, w.message);
	}
	for (const auto &c : result.conflicts)
		out += std::format("{}{}\n", constants::text::warn_prefix, c.description);
	for (const auto &n : result.near_misses) {
		out += std::format("{}Group of {} left out {} connected player(s): {}\n", constants::text::warn_prefix, n.player_ids.size(), n.excluded_ids.size(),
											 n.excluded_ids | std::views::join_with(std::string_view{", "}) | std::ranges::to<std::string>());
	}
	return out.empty() ? out : out + "\n";
}

auto report_builder::build_stats(const generation_stats &stats) -> std::string
{
	std::string out = "Statistics:\n";
	out += std::format("  Players: {} total, {} assigned, {} unassigned\n", stats.total_players, stats.assigned_players, stats.unassigned_players);
	out += std::format("  Must-have requests: {} honored, {} broken\n", stats.must_have_honored, stats.must_have_broken);
	out += std::format("  Nice-to-have requests: {} honored, {} broken\n", stats.nice_to_have_honored, stats.nice_to_have_broken);
	out += std::format("  Groups: {} intact, {} broken\n", stats.groups_intact, stats.groups_broken);
	out += std::format("  Conflicts detected: {}, avoid violations: {}\n", stats.conflicts_detected, stats.avoid_violations);
	out += std::format("  Generation time: {} ms\n", stats.generation_time.count());
	return out;
}

auto report_builder::build_validation(const group_validation &validation) -> std::string
{
	std::string out;
	for (const auto &e : validation.errors)
		out += std::format("{}{}\n", constants::text::err_prefix, e);
	for (const auto &w : validation.warnings)
		out += std::format("{}{}\n", constants::text::warn_prefix, w);
	return out;
}

auto report_builder::format_team_members(const team &t) -> std::string
{
	std::string result;
	for (const auto &member : t.players)
		result += std::format("  - {}\n", format_player(member));
	return result;
}

auto report_builder::format_player(const player &p) -> std::string
{
	std::string out = std::format("{} [{}] {:.1f}", p.name, to_string(p.gender), p.effective_skill());
	if (p.handler())
		out += " (handler)";
	if (p.group_id)
		out += std::format(" <{}>", *p.group_id);
	return out;
}

} // namespace teamforge::ui
