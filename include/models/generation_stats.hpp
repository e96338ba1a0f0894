#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>

namespace teamforge {

class generation_stats {
public:
	std::size_t total_players{};
	std::size_t assigned_players{};
	std::size_t unassigned_players{};

	std::size_t must_have_honored{};
	std::size_t must_have_broken{};
	std::size_t nice_to_have_honored{};
	std::size_t nice_to_have_broken{};

	std::size_t groups_intact{};
	std::size_t groups_broken{};

	std::size_t conflicts_detected{};
	std::size_t avoid_violations{};

	std::chrono::milliseconds generation_time{};

	[[nodiscard]] auto operator==(const generation_stats &) const -> bool = default;

	[[nodiscard]] auto requests_honored(this const auto &self) -> std::size_t { return self.must_have_honored + self.nice_to_have_honored; }

	[[nodiscard]] auto requests_broken(this const auto &self) -> std::size_t { return self.must_have_broken + self.nice_to_have_broken; }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"totalPlayers", self.total_players},
						{"assignedPlayers", self.assigned_players},
						{"unassignedPlayers", self.unassigned_players},
						{"mustHaveHonored", self.must_have_honored},
						{"mustHaveBroken", self.must_have_broken},
						{"niceToHaveHonored", self.nice_to_have_honored},
						{"niceToHaveBroken", self.nice_to_have_broken},
						{"requestsHonored", self.requests_honored()},
						{"requestsBroken", self.requests_broken()},
						{"groupsIntact", self.groups_intact},
						{"groupsBroken", self.groups_broken},
						{"conflictsDetected", self.conflicts_detected},
						{"avoidRequestsViolated", self.avoid_violations},
						{"generationTime", self.generation_time.count()}};
	}
};

} // namespace teamforge
