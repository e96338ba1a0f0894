#include "services/group_formation.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace teamforge {

auto to_string(warning_category c) -> std::string_view
{
	switch (c) {
	case warning_category::match_exact:
		return "match-exact";
	case warning_category::match_review:
		return "match-review";
	case warning_category::suggestion:
		return "suggestion";
	case warning_category::not_found:
		break;
	}
	return "not-found";
}

auto to_string(conflict_type c) -> std::string_view { return c == conflict_type::avoid_vs_request ? "avoid-vs-request" : "one-way-request"; }

auto resolution_warning::to_json() const -> nlohmann::json
{
	nlohmann::json out{{"category", std::string{to_string(category)}}, {"playerName", player_name}, {"requestedName", requested_name}, {"message", message}};
	if (matched_name)
		out["matchedName"] = *matched_name;
	if (confidence)
		out["confidence"] = std::string{to_string(*confidence)};
	return out;
}

auto request_conflict::to_json() const -> nlohmann::json
{
	return {{"requesterId", requester_id}, {"targetId", target_id}, {"conflictType", std::string{to_string(type)}}, {"description", description}};
}

auto near_miss_group::to_json() const -> nlohmann::json { return {{"playerIds", player_ids}, {"excludedIds", excluded_ids}, {"reason", reason}}; }

// ---- connection_graph -------------------------------------------------------

auto connection_graph::add_edge(std::size_t a, std::size_t b) -> void
{
	if (a == b || has_edge(a, b))
		return;
	adjacency_.at(a).push_back(b);
	adjacency_.at(b).push_back(a);
	++edges_;
}

auto connection_graph::has_edge(std::size_t a, std::size_t b) const -> bool
{
	if (a >= adjacency_.size() || b >= adjacency_.size())
		return false;
	return std::ranges::find(adjacency_[a], b) != adjacency_[a].end();
}

auto connection_graph::discover(std::size_t start, const std::vector<bool> &taken) const -> std::vector<std::size_t>
{
	if (start >= adjacency_.size() || taken.at(start))
		return {};

	std::vector<bool> seen(adjacency_.size(), false);
	std::vector<std::size_t> order{start};
	seen[start] = true;

	// `order` doubles as the BFS queue
	for (std::size_t head = 0; head < order.size(); ++head) {
		for (auto next : adjacency_[order[head]]) {
			if (seen[next] || taken.at(next))
				continue;
			seen[next] = true;
			order.push_back(next);
		}
	}
	return order;
}

auto connection_graph::truncate(std::span<const std::size_t> order, std::size_t cap, const compatibility &compatible) const -> component
{
	component out;
	for (auto node : order) {
		if (out.members.size() >= cap) {
			out.overflow.push_back(node);
			continue;
		}

		const bool linked = out.members.empty() || std::ranges::any_of(out.members, [&](std::size_t m) { return has_edge(m, node); });
		if (!linked || (compatible && !compatible(node, out.members))) {
			out.rejected.push_back(node);
			continue;
		}
		out.members.push_back(node);
	}
	return out;
}

// ---- group_formation --------------------------------------------------------

group_formation::group_formation(name_resolver &resolver, const avoid_graph &avoids, log_sink log, double threshold)
		: resolver_(resolver), avoids_(avoids), log_(std::move(log)), threshold_(threshold)
{
}

auto group_formation::resolve_requests(std::span<const player> roster) -> std::vector<std::vector<resolved_request>>
{
	const auto names = roster | std::views::transform(&player::name) | std::ranges::to<std::vector<std::string>>();

	std::vector<std::vector<resolved_request>> out(roster.size());
	for (std::size_t i = 0; i < roster.size(); ++i) {
		const auto &requests = roster[i].teammate_requests;
		out[i].reserve(requests.size());

		for (std::size_t k = 0; k < requests.size(); ++k) {
			resolved_request req{.requested_name = requests[k], .priority = priority_for_index(k)};
			req.outcome = resolver_.resolve(requests[k], names, threshold_);
			// a request that lands on the requester is dropped
			if (req.outcome.applied() && req.outcome.candidate_index && *req.outcome.candidate_index != i)
				req.target = req.outcome.candidate_index;
			out[i].push_back(std::move(req));
		}
	}
	return out;
}

auto group_formation::detect_request_conflicts(std::span<const player> roster, std::span<const std::vector<resolved_request>> resolved) const
		-> std::vector<request_conflict>
{
	const auto requests_back = [&](std::size_t from, std::size_t to) {
		return std::ranges::any_of(resolved[from], [to](const resolved_request &r) { return r.target == to; });
	};

	std::vector<request_conflict> out;
	for (std::size_t i = 0; i < resolved.size(); ++i) {
		for (const auto &req : resolved[i]) {
			if (!req.target)
				continue;

			const auto &from = roster[i];
			const auto &to = roster[*req.target];
			if (avoids_.conflicts(from.id, to.id)) {
				out.push_back({.requester_id = from.id,
											 .target_id = to.id,
											 .type = conflict_type::avoid_vs_request,
											 .description = std::format("{} requested {}, but they have an avoid relationship", from.name, to.name)});
			}
			else if (!requests_back(*req.target, i)) {
				out.push_back({.requester_id = from.id,
											 .target_id = to.id,
											 .type = conflict_type::one_way_request,
											 .description = std::format("{} requested {}, but {} did not request {}", from.name, to.name, to.name, from.name)});
			}
		}
	}
	return out;
}

auto group_formation::build_graph(std::span<const std::vector<resolved_request>> resolved) -> connection_graph
{
	connection_graph graph(resolved.size());
	for (std::size_t i = 0; i < resolved.size(); ++i) {
		for (const auto &req : resolved[i]) {
			if (!req.target)
				continue;
			const auto j = *req.target;
			const bool mutual = std::ranges::any_of(resolved[j], [i](const resolved_request &r) { return r.target == i; });
			if (mutual)
				graph.add_edge(i, j);
		}
	}
	return graph;
}

auto group_formation::make_warning(const player &requester, const resolved_request &req) -> std::optional<resolution_warning>
{
	resolution_warning w{.player_name = requester.name, .requested_name = req.requested_name};
	if (req.outcome.match) {
		w.matched_name = req.outcome.match->match;
		w.confidence = req.outcome.match->confidence;
	}

	switch (req.outcome.status) {
	case resolution_status::accepted:
		if (!req.outcome.match || req.outcome.match->score >= constants::matching::exact_score)
			return std::nullopt;
		w.category = warning_category::match_exact;
		w.message = std::format("Player \"{}\": Teammate request \"{}\" matched to \"{}\" ({})", requester.name, req.requested_name, req.outcome.match->match,
														req.outcome.match->reason);
		break;
	case resolution_status::needs_review:
		w.category = warning_category::match_review;
		w.message = std::format("Player \"{}\": Teammate request \"{}\" matched to \"{}\" ({}) - please verify", requester.name, req.requested_name,
														req.outcome.match->match, req.outcome.match->reason);
		break;
	case resolution_status::suggestion:
		w.category = warning_category::suggestion;
		w.message = std::format("Player \"{}\": Teammate request \"{}\" not found; closest is \"{}\" ({})", requester.name, req.requested_name,
														req.outcome.match->match, req.outcome.match->reason);
		break;
	case resolution_status::not_found:
		w.category = warning_category::not_found;
		w.message = std::format("Player \"{}\": Teammate request \"{}\" not found in roster", requester.name, req.requested_name);
		break;
	}
	return w;
}

auto group_formation::process_mutual_requests(std::span<const player> roster) -> formation_result
{
	formation_result result;
	result.players.assign(roster.begin(), roster.end());
	for (auto &p : result.players) {
		p.group_id.reset();
		p.unfulfilled_requests.clear();
	}

	const auto resolved = resolve_requests(roster);
	for (std::size_t i = 0; i < roster.size(); ++i) {
		for (const auto &req : resolved[i]) {
			if (auto w = make_warning(roster[i], req))
				result.warnings.push_back(std::move(*w));
		}
	}

	result.conflicts = detect_request_conflicts(roster, resolved);
	result.graph = build_graph(resolved);

	// ---- Cut components into groups -----------------------------------------
	std::vector<bool> taken(roster.size(), false);
	std::vector<std::optional<std::size_t>> group_of(roster.size());

	// A group never holds two players who avoid each other, even through a third member.
	const auto no_avoid = [&](std::size_t node, std::span<const std::size_t> members) {
		return std::ranges::none_of(members, [&](std::size_t m) { return avoids_.conflicts(roster[node].id, roster[m].id); });
	};

	for (std::size_t i = 0; i < roster.size(); ++i) {
		if (taken[i] || result.graph.neighbors(i).empty())
			continue;

		const auto order = result.graph.discover(i, taken);
		auto comp = result.graph.truncate(order, constants::limits::max_group_size, no_avoid);
		if (comp.members.size() < 2)
			continue;

		const auto index = result.groups.size();
		player_group group{.id = group_id(index), .label = group_label(index), .color = std::string{group_color(index)}};

		for (auto m : comp.members) {
			taken[m] = true;
			group_of[m] = index;
			result.players[m].group_id = group.id;
			group.player_ids.push_back(roster[m].id);
			group.players.push_back(result.players[m]);
		}

		if (!comp.overflow.empty()) {
			near_miss_group miss;
			miss.player_ids = group.player_ids;
			for (auto o : comp.overflow)
				miss.excluded_ids.push_back(roster[o].id);
			log(log_, log_level::warning, "Group {} reached {} players; {} connected player(s) left out", group.label, constants::limits::max_group_size,
					comp.overflow.size());
			result.near_misses.push_back(std::move(miss));
		}

		result.groups.push_back(std::move(group));
	}

	// ---- Classify every teammate request ------------------------------------
	for (std::size_t i = 0; i < roster.size(); ++i) {
		for (const auto &req : resolved[i]) {
			if (!req.target) {
				result.players[i].unfulfilled_requests.push_back({.name = req.requested_name, .reason = request_outcome::not_found, .priority = req.priority});
				continue;
			}

			const auto t = *req.target;
			if (group_of[i] && group_of[i] == group_of[t])
				continue; // honored

			request_outcome reason = request_outcome::non_reciprocal;
			if (avoids_.conflicts(roster[i].id, roster[t].id))
				reason = request_outcome::conflict;
			else if (result.graph.has_edge(i, t))
				reason = request_outcome::group_full;

			result.players[i].unfulfilled_requests.push_back({.name = roster[t].name, .reason = reason, .priority = req.priority});
		}
	}

	// keep group snapshots in sync with the stamped players
	for (auto &g : result.groups) {
		for (auto &gp : g.players) {
			auto it = std::ranges::find(result.players, gp.id, &player::id);
			if (it != result.players.end())
				gp = *it;
		}
	}

	log(log_, log_level::info, "Formed {} group(s) from {} reciprocal link(s); {} conflict(s) noted", result.groups.size(), result.graph.edge_count(),
			result.conflicts.size());
	return result;
}

auto validate_groups_for_generation(std::span<const player_group> groups, int max_team_size) -> group_validation
{
	group_validation out;
	for (const auto &g : groups) {
		const auto n = static_cast<long long>(g.size());
		if (n > max_team_size)
			out.errors.push_back(std::format("Group {} has {} players but teams hold at most {}; it can never be placed", g.label, n, max_team_size));
		else if (n == max_team_size)
			out.warnings.push_back(std::format("Group {} has {} players and will fill an entire team", g.label, n));
	}
	return out;
}

auto find_player_group(std::span<const player_group> groups, std::string_view player_id) -> const player_group *
{
	auto it = std::ranges::find_if(groups, [&](const player_group &g) { return g.contains(player_id); });
	return it == groups.end() ? nullptr : &*it;
}

} // namespace teamforge
