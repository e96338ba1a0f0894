#include "services/avoid_graph.hpp"

#include <algorithm>
#include <ranges>

namespace teamforge {

auto avoid_graph::build(std::span<const player> roster, name_resolver &resolver, double threshold) -> avoid_graph
{
	avoid_graph g;
	const auto names = roster | std::views::transform(&player::name) | std::ranges::to<std::vector<std::string>>();

	for (const auto &p : roster) {
		for (const auto &requested : p.avoid_requests) {
			const auto res = resolver.resolve(requested, names, threshold);
			if (!res.applied() || !res.candidate_index)
				continue;

			const auto &target = roster[*res.candidate_index];
			if (target.id == p.id)
				continue;

			g.add(p.id, target.id);
		}
	}
	return g;
}

auto avoid_graph::add(std::string_view a, std::string_view b) -> void
{
	if (a == b)
		return;

	const bool inserted = links_[std::string{a}].emplace(b).second;
	links_[std::string{b}].emplace(a);
	if (inserted)
		++pair_count_;
}

auto avoid_graph::conflicts(std::string_view a, std::string_view b) const -> bool
{
	auto it = links_.find(std::string{a});
	return it != links_.end() && it->second.contains(std::string{b});
}

auto avoid_graph::conflicts_with_any(std::string_view id, std::span<const std::string> others) const -> bool
{
	return std::ranges::any_of(others, [&](const std::string &o) { return conflicts(id, o); });
}

auto avoid_graph::conflicts_with_any(std::string_view id, std::span<const player> others) const -> bool
{
	return std::ranges::any_of(others, [&](const player &o) { return conflicts(id, o.id); });
}

auto avoid_graph::avoided_by(std::string_view id) const -> std::vector<std::string>
{
	auto it = links_.find(std::string{id});
	if (it == links_.end())
		return {};

	std::vector<std::string> out(it->second.begin(), it->second.end());
	std::ranges::sort(out);
	return out;
}

} // namespace teamforge
