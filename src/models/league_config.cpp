#include "core/constants.hpp"
#include "models/league_config.hpp"

#include <string_view>

namespace teamforge {

auto league_config::problems() const -> std::vector<std::string>
{
	std::vector<std::string> out;

	if (util::trim(name).empty())
		out.emplace_back(constants::text::config_name_required);

	if (max_team_size < constants::limits::min_team_size)
		out.emplace_back(constants::text::team_size_too_small);

	if (max_team_size > constants::limits::max_team_size)
		out.emplace_back(constants::text::team_size_too_large);

	if (min_females < 0)
		out.emplace_back(constants::text::min_females_negative);

	if (min_males < 0)
		out.emplace_back(constants::text::min_males_negative);

	if (min_females + min_males > max_team_size)
		out.emplace_back(constants::text::quota_exceeds_size);

	if (target_teams && *target_teams < 1)
		out.emplace_back(constants::text::target_teams_too_small);

	return out;
}

auto league_config::validate() const -> std::expected<type::ok_t, type::error>
{
	const auto errs = problems();
	if (errs.empty())
		return type::ok_t{};

	std::string message;
	for (const auto &e : errs) {
		if (!message.empty())
			message += '\n';
		message += e;
	}
	return std::unexpected(type::error{std::move(message)});
}

auto league_config::team_count(std::size_t player_count) const -> std::size_t
{
	if (target_teams)
		return *target_teams > 0 ? static_cast<std::size_t>(*target_teams) : 0;

	if (max_team_size <= 0 || player_count == 0)
		return 0;

	const auto cap = static_cast<std::size_t>(max_team_size);
	return (player_count + cap - 1) / cap;
}

auto league_config::to_json() const -> nlohmann::json
{
	nlohmann::json out{{"id", id},
										 {"name", name},
										 {"maxTeamSize", max_team_size},
										 {"minFemales", min_females},
										 {"minMales", min_males},
										 {"allowMixedGender", allow_mixed_gender}};
	if (target_teams)
		out["targetTeams"] = *target_teams;
	return out;
}

/**
 * @brief Parse a config; absent fields keep their defaults.
 */
auto league_config::from_json(const nlohmann::json &j) -> league_config
{
	league_config c;
	c.id = j.value("id", c.id);
	c.name = j.value("name", c.name);
	c.max_team_size = j.value("maxTeamSize", c.max_team_size);
	c.min_females = j.value("minFemales", c.min_females);
	c.min_males = j.value("minMales", c.min_males);
	if (auto it = j.find("targetTeams"); it != j.end() && it->is_number_integer())
		c.target_teams = it->get<int>();
	c.allow_mixed_gender = j.value("allowMixedGender", c.allow_mixed_gender);
	return c;
}

} // namespace teamforge
