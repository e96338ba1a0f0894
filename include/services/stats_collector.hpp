#pragma once

#include "models/generation_stats.hpp"
#include "models/player.hpp"
#include "models/player_group.hpp"
#include "models/team.hpp"
#include "services/avoid_graph.hpp"
#include "services/name_resolver.hpp"

#include <chrono>
#include <span>

namespace teamforge {

/**
 * @class stats_collector
 * @brief Read-only metrics over a finished composition.
 *        Requests are re-resolved at the stricter stats threshold; anything that
 *        does not resolve there is left out of the honored/broken counts.
 */
class stats_collector {
public:
	explicit stats_collector(name_resolver &resolver) : resolver_(resolver) {}

	[[nodiscard]] auto collect(std::span<const player> roster, std::span<const team> teams, std::span<const player> unassigned,
														 std::span<const player_group> groups, const avoid_graph &avoids, std::size_t conflicts_detected,
														 std::chrono::milliseconds duration) -> generation_stats;

	// Unordered pairs that avoid each other yet share a team.
	[[nodiscard]] static auto count_avoid_violations(std::span<const team> teams, const avoid_graph &avoids) -> std::size_t;

private:
	name_resolver &resolver_;
};

} // namespace teamforge
