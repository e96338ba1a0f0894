#include "core/logging.hpp"
#include "models/generation_stats.hpp"
#include "models/league_config.hpp"
#include "models/player.hpp"
#include "models/player_group.hpp"
#include "models/team.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace teamforge {
namespace {

using test_support::make_config;
using test_support::make_player;

TEST(PlayerTest, ExecRatingOverridesSkill) {
	auto p = make_player("p1", "Alice Walker", gender::female, 4.0);
	EXPECT_DOUBLE_EQ(p.effective_skill(), 4.0);
	p.exec_skill_rating = 8.5;
	EXPECT_DOUBLE_EQ(p.effective_skill(), 8.5);
	EXPECT_FALSE(p.handler());
}

TEST(PlayerTest, JsonKeepsRequestsAndOptionalFields) {
	auto p = make_player("p1", "Alice Walker", gender::female, 6.5, {"Brian Cooper", "Chloe Davis"}, {"Derek Evans"});
	p.is_handler = true;
	p.group_id = "group-0";
	p.unfulfilled_requests.push_back({.name = "Chloe Davis", .reason = request_outcome::group_full, .priority = request_priority::nice_to_have});

	const auto j = p.to_json();
	EXPECT_EQ(j.at("gender").get<std::string>(), "F");
	EXPECT_TRUE(j.at("execSkillRating").is_null());
	EXPECT_EQ(j.at("unfulfilledRequests")[0].at("reason").get<std::string>(), "group-full");
	EXPECT_FALSE(j.contains("teamId"));

	const auto back = player::from_json(j);
	EXPECT_EQ(back, p);
}

TEST(PlayerTest, FromJsonDefaults) {
	const auto p = player::from_json(nlohmann::json{{"id", "x"}, {"name", "Xavier"}, {"gender", "male"}, {"execSkillRating", nullptr}});
	EXPECT_EQ(p.gender, gender::male);
	EXPECT_DOUBLE_EQ(p.skill_rating, 0.0);
	EXPECT_FALSE(p.exec_skill_rating.has_value());
	EXPECT_TRUE(p.teammate_requests.empty());
	EXPECT_FALSE(p.is_handler.has_value());
}

TEST(PlayerTest, GenderParsing) {
	EXPECT_EQ(gender_from_string("M"), gender::male);
	EXPECT_EQ(gender_from_string(" Female "), gender::female);
	EXPECT_EQ(gender_from_string("nonbinary"), gender::other);
	EXPECT_EQ(to_string(gender::other), "Other");
	EXPECT_EQ(to_string(priority_for_index(0)), "must-have");
	EXPECT_EQ(priority_for_index(3), request_priority::nice_to_have);
}

TEST(TeamTest, MembershipKeepsStatsCurrent) {
	auto t = make_team(3);
	EXPECT_EQ(t.id, "team-3");
	EXPECT_EQ(t.name, "Team 3");

	auto handler = make_player("a", "Ann", gender::female, 8.0);
	handler.is_handler = true;
	t.add_player(handler);
	t.add_player(make_player("b", "Ben", gender::male, 4.0));

	EXPECT_EQ(t.size(), 2u);
	EXPECT_DOUBLE_EQ(t.average_skill, 6.0);
	EXPECT_EQ(t.genders.female, 1);
	EXPECT_EQ(t.genders.male, 1);
	EXPECT_EQ(t.handler_count, 1);
	EXPECT_EQ(t.players[0].team_id, "team-3");

	const auto removed = t.remove_player("a");
	ASSERT_TRUE(removed.has_value());
	EXPECT_FALSE(removed->team_id.has_value());
	EXPECT_DOUBLE_EQ(t.average_skill, 4.0);
	EXPECT_EQ(t.handler_count, 0);
	EXPECT_FALSE(t.remove_player("zz").has_value());

	t.remove_player("b");
	EXPECT_TRUE(t.empty());
	EXPECT_DOUBLE_EQ(t.average_skill, 0.0);
}

TEST(TeamTest, JsonCarriesBreakdown) {
	auto t = make_team(1);
	t.add_player(make_player("a", "Ann", gender::female, 5.0));
	const auto j = t.to_json();
	EXPECT_EQ(j.at("genderBreakdown").at("F").get<int>(), 1);
	EXPECT_EQ(j.at("players").size(), 1u);
}

TEST(LeagueConfigTest, DefaultsAreValid) {
	const league_config c;
	EXPECT_EQ(c.max_team_size, 12);
	EXPECT_TRUE(c.allow_mixed_gender);
	EXPECT_TRUE(c.validate().has_value());
}

TEST(LeagueConfigTest, ValidateListsEveryProblem) {
	league_config c;
	c.name = "  ";
	c.max_team_size = 0;
	c.min_females = -1;
	c.target_teams = 0;

	const auto problems = c.problems();
	EXPECT_EQ(problems.size(), 4u);

	const auto r = c.validate();
	ASSERT_FALSE(r.has_value());
	EXPECT_NE(r.error().message.find(constants::text::config_name_required), std::string::npos);
	EXPECT_NE(r.error().message.find(constants::text::team_size_too_small), std::string::npos);
	EXPECT_NE(r.error().message.find(constants::text::min_females_negative), std::string::npos);
	EXPECT_NE(r.error().message.find(constants::text::target_teams_too_small), std::string::npos);
}

TEST(LeagueConfigTest, QuotaMustFitTeamSize) {
	auto c = make_config(4, std::nullopt, 3, 2);
	const auto r = c.validate();
	ASSERT_FALSE(r.has_value());
	EXPECT_EQ(r.error().message, constants::text::quota_exceeds_size);

	c.max_team_size = 51;
	c.min_females = 0;
	c.min_males = 0;
	EXPECT_EQ(c.problems(), std::vector<std::string>{std::string{constants::text::team_size_too_large}});
}

TEST(LeagueConfigTest, TeamCount) {
	auto c = make_config(4);
	EXPECT_EQ(c.team_count(0), 0u);
	EXPECT_EQ(c.team_count(8), 2u);
	EXPECT_EQ(c.team_count(9), 3u);
	c.target_teams = 5;
	EXPECT_EQ(c.team_count(3), 5u);
}

TEST(LeagueConfigTest, JsonRoundTrip) {
	auto c = make_config(6, 3, 2, 1);
	c.allow_mixed_gender = false;
	const auto back = league_config::from_json(c.to_json());
	EXPECT_EQ(back.max_team_size, 6);
	EXPECT_EQ(back.target_teams, 3);
	EXPECT_EQ(back.min_females, 2);
	EXPECT_EQ(back.min_males, 1);
	EXPECT_FALSE(back.allow_mixed_gender);

	const auto partial = league_config::from_json(nlohmann::json{{"maxTeamSize", 8}});
	EXPECT_EQ(partial.name, "Default League");
	EXPECT_FALSE(partial.target_teams.has_value());
}

TEST(PlayerGroupTest, FromJsonNeedsOnlyIds) {
	const auto g = player_group::from_json(nlohmann::json{{"id", "custom-1"}, {"playerIds", {"a", "b"}}});
	EXPECT_EQ(g.size(), 2u);
	EXPECT_TRUE(g.contains("b"));
	EXPECT_TRUE(g.label.empty());
	EXPECT_TRUE(g.players.empty());
}

TEST(GenerationStatsTest, Totals) {
	generation_stats s;
	s.must_have_honored = 3;
	s.nice_to_have_honored = 2;
	s.must_have_broken = 1;
	EXPECT_EQ(s.requests_honored(), 5u);
	EXPECT_EQ(s.requests_broken(), 1u);
	EXPECT_EQ(s.to_json().at("requestsHonored").get<std::size_t>(), 5u);
}

TEST(LoggingTest, SinkReceivesFormattedMessage) {
	std::vector<std::string> lines;
	const log_sink sink = [&](log_level level, std::string_view message) { lines.push_back(std::format("{} {}", to_string(level), message)); };

	log(sink, log_level::warning, "{} of {}", 2, 3);
	log({}, log_level::error, "dropped");

	ASSERT_EQ(lines.size(), 1u);
	EXPECT_EQ(lines[0], "WARNING 2 of 3");
}

} // namespace
} // namespace teamforge
