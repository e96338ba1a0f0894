#include "services/constraint_assigner.hpp"
#include "services/skill_balancer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <ranges>

namespace teamforge {

skill_balancer::skill_balancer(const league_config &config, const avoid_graph &avoids, balance_options options, log_sink log)
		: config_(config), avoids_(avoids), options_(options), log_(std::move(log))
{
}

auto skill_balancer::spread(std::span<const team> teams) -> double
{
	auto averages = teams | std::views::filter([](const team &t) { return !t.empty(); }) | std::views::transform(&team::average_skill) |
									std::ranges::to<std::vector<double>>();
	if (averages.size() < 2)
		return 0.0;
	auto [min_it, max_it] = std::ranges::minmax_element(averages);
	return *max_it - *min_it;
}

auto skill_balancer::sample(const team &t, std::size_t count) -> std::vector<std::size_t>
{
	std::vector<std::size_t> order(t.players.size());
	std::iota(order.begin(), order.end(), 0);
	std::ranges::stable_sort(order, {}, [&](std::size_t i) { return t.players[i].effective_skill(); });

	if (order.size() <= count)
		return order;
	if (count == 0)
		return {};
	if (count == 1)
		return {order[order.size() / 2]};

	std::vector<std::size_t> out;
	out.reserve(count);
	for (std::size_t k = 0; k < count; ++k)
		out.push_back(order[k * (order.size() - 1) / (count - 1)]);
	return out;
}

auto skill_balancer::handler_penalty(int handlers) const -> int { return std::abs(handlers - options_.handler_target); }

auto skill_balancer::evaluate(const std::vector<team> &teams, std::size_t weak, std::size_t strong, std::size_t wi, std::size_t si) const
		-> std::optional<double>
{
	const auto &wt = teams[weak];
	const auto &st = teams[strong];
	const auto &wp = wt.players[wi];
	const auto &sp = st.players[si];

	if (wp.effective_skill() >= sp.effective_skill())
		return std::nullopt;
	// groups stay atomic
	if (wp.group_id || sp.group_id)
		return std::nullopt;

	for (const auto &p : st.players) {
		if (p.id != sp.id && avoids_.conflicts(wp.id, p.id))
			return std::nullopt;
	}
	for (const auto &p : wt.players) {
		if (p.id != wp.id && avoids_.conflicts(sp.id, p.id))
			return std::nullopt;
	}

	if (wp.gender != sp.gender) {
		auto wg = wt.genders;
		auto sg = st.genders;
		wg.add(wp.gender, -1);
		wg.add(sp.gender);
		sg.add(sp.gender, -1);
		sg.add(wp.gender);
		if (!quota_achievable(wg, wt.size(), config_) || !quota_achievable(sg, st.size(), config_) || !gender_mix_allowed(wg, config_) ||
				!gender_mix_allowed(sg, config_))
			return std::nullopt;
	}

	const double delta = sp.effective_skill() - wp.effective_skill();
	const double weak_avg = wt.average_skill + delta / static_cast<double>(wt.size());
	const double strong_avg = st.average_skill - delta / static_cast<double>(st.size());
	const double gap_gain = std::abs(st.average_skill - wt.average_skill) - std::abs(strong_avg - weak_avg);

	const int weak_handlers = wt.handler_count - (wp.handler() ? 1 : 0) + (sp.handler() ? 1 : 0);
	const int strong_handlers = st.handler_count - (sp.handler() ? 1 : 0) + (wp.handler() ? 1 : 0);
	const int role_gain =
			handler_penalty(wt.handler_count) + handler_penalty(st.handler_count) - handler_penalty(weak_handlers) - handler_penalty(strong_handlers);

	return gap_gain + options_.role_weight * role_gain;
}

auto skill_balancer::balance(std::vector<team> &teams) const -> balance_report
{
	balance_report report;
	report.initial_spread = spread(teams);

	for (int pass = 0; pass < options_.max_passes; ++pass) {
		std::vector<std::size_t> order;
		for (std::size_t i = 0; i < teams.size(); ++i) {
			if (!teams[i].empty())
				order.push_back(i);
		}
		if (order.size() < 2)
			break;

		std::ranges::stable_sort(order, {}, [&](std::size_t i) { return teams[i].average_skill; });
		if (teams[order.back()].average_skill - teams[order.front()].average_skill < options_.spread_threshold)
			break;

		++report.passes;

		std::vector<std::pair<std::size_t, std::size_t>> pairs;
		for (std::size_t j = 0; j + 1 < order.size(); ++j)
			pairs.emplace_back(order[j], order[j + 1]);
		if (order.size() > 2)
			pairs.emplace_back(order.front(), order.back());

		std::optional<candidate> best;
		for (const auto &[weak, strong] : pairs) {
			const auto weak_sample = sample(teams[weak], options_.sample_size);
			const auto strong_sample = sample(teams[strong], options_.sample_size);

			for (auto wi : weak_sample) {
				for (auto si : strong_sample) {
					auto score = evaluate(teams, weak, strong, wi, si);
					if (score && (!best || *score > best->score))
						best = candidate{weak, strong, wi, si, *score};
				}
			}
		}

		if (!best || best->score < options_.min_improvement)
			break;

		auto &wt = teams[best->weak_team];
		auto &st = teams[best->strong_team];
		std::swap(wt.players[best->weak_player], st.players[best->strong_player]);
		wt.players[best->weak_player].team_id = wt.id;
		st.players[best->strong_player].team_id = st.id;
		wt.recompute_stats();
		st.recompute_stats();
		++report.swaps;

		log(log_, log_level::debug, "Swapped {} ({}) and {} ({}), improvement {:.3f}", wt.players[best->weak_player].name, wt.name,
				st.players[best->strong_player].name, st.name, best->score);
	}

	report.final_spread = spread(teams);
	log(log_, log_level::info, "Skill spread {:.2f} -> {:.2f} after {} swap(s) in {} pass(es)", report.initial_spread, report.final_spread, report.swaps,
			report.passes);
	return report;
}

} // namespace teamforge
