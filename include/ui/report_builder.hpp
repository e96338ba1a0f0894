#pragma once

#include "models/generation_stats.hpp"
#include "models/team.hpp"
#include "services/group_formation.hpp"
#include "services/team_generator.hpp"

#include <span>
#include <string>

namespace teamforge::ui {

class report_builder {
public:
	// Build the full plain-text report
	[[nodiscard]] static auto build_report(const generation_result &result) -> std::string;

	// Build team list with members
	[[nodiscard]] static auto build_teams(std::span<const team> teams) -> std::string;

	[[nodiscard]] static auto build_unassigned(std::span<const player> players) -> std::string;

	// Resolution warnings, conflicts and near-misses
	[[nodiscard]] static auto build_warnings(const generation_result &result) -> std::string;

	[[nodiscard]] static auto build_stats(const generation_stats &stats) -> std::string;

	// Pre-generation group checks, prefixed with [error] / [warn]
	[[nodiscard]] static auto build_validation(const group_validation &validation) -> std::string;

private:
	// Format helpers
	[[nodiscard]] static auto format_team_members(const team &t) -> std::string;
	[[nodiscard]] static auto format_player(const player &p) -> std::string;
};

} // namespace teamforge::ui
