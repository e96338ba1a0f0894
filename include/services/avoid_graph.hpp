#pragma once

#include "core/constants.hpp"
#include "models/player.hpp"
#include "services/name_resolver.hpp"

#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace teamforge {

/**
 * @class avoid_graph
 * @brief Symmetric "never on the same team" relation between player ids.
 *        Built once per run from every player's avoid requests; either side
 *        naming the other is enough to link the pair.
 */
class avoid_graph {
public:
	avoid_graph() = default;

	/**
	 * @brief Resolve each avoid request against the roster names and link the pair.
	 *        Only applied resolutions (accepted / needs review) create links.
	 */
	[[nodiscard]] static auto build(std::span<const player> roster, name_resolver &resolver, double threshold = constants::matching::default_threshold)
			-> avoid_graph;

	auto add(std::string_view a, std::string_view b) -> void;

	[[nodiscard]] auto conflicts(std::string_view a, std::string_view b) const -> bool;

	// True if `id` conflicts with any of `others`.
	[[nodiscard]] auto conflicts_with_any(std::string_view id, std::span<const std::string> others) const -> bool;
	[[nodiscard]] auto conflicts_with_any(std::string_view id, std::span<const player> others) const -> bool;

	[[nodiscard]] auto avoided_by(std::string_view id) const -> std::vector<std::string>;

	[[nodiscard]] auto pair_count() const noexcept -> std::size_t { return pair_count_; }

	[[nodiscard]] auto empty() const noexcept -> bool { return pair_count_ == 0; }

private:
	std::unordered_map<std::string, std::unordered_set<std::string>> links_;
	std::size_t pair_count_{};
};

} // namespace teamforge
