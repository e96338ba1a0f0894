#pragma once

#include "core/constants.hpp"
#include "core/logging.hpp"
#include "models/league_config.hpp"
#include "models/team.hpp"
#include "services/avoid_graph.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <vector>

namespace teamforge {

struct balance_options {
	int max_passes{constants::balance::max_passes};
	double spread_threshold{constants::balance::spread_threshold};
	std::size_t sample_size{constants::balance::sample_size}; // players tried per team and pair
	double min_improvement{constants::balance::min_improvement};
	int handler_target{constants::balance::handler_target};
	double role_weight{constants::balance::role_weight};
};

struct balance_report {
	int passes{};
	int swaps{};
	double initial_spread{};
	double final_spread{};

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"passes", self.passes}, {"swaps", self.swaps}, {"initialSpread", self.initial_spread}, {"finalSpread", self.final_spread}};
	}
};

/**
 * @class skill_balancer
 * @brief Greedy one-swap-per-pass local search over skill averages.
 *        Grouped players never move; swaps never create avoid conflicts or
 *        make a gender minimum unreachable.
 */
class skill_balancer {
public:
	skill_balancer(const league_config &config, const avoid_graph &avoids, balance_options options = {}, log_sink log = {});

	auto balance(std::vector<team> &teams) const -> balance_report;

	// max - min average skill over non-empty teams, 0 with fewer than two.
	[[nodiscard]] static auto spread(std::span<const team> teams) -> double;

	// Up to `count` player indices spread evenly across the team's skill order.
	[[nodiscard]] static auto sample(const team &t, std::size_t count) -> std::vector<std::size_t>;

private:
	struct candidate {
		std::size_t weak_team;
		std::size_t strong_team;
		std::size_t weak_player;
		std::size_t strong_player;
		double score;
	};

	const league_config &config_;
	const avoid_graph &avoids_;
	balance_options options_;
	log_sink log_;

	[[nodiscard]] auto evaluate(const std::vector<team> &teams, std::size_t weak, std::size_t strong, std::size_t wi, std::size_t si) const
			-> std::optional<double>;
	[[nodiscard]] auto handler_penalty(int handlers) const -> int;
};

} // namespace teamforge
