#include "services/constraint_assigner.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace teamforge {
namespace {

using test_support::make_config;
using test_support::make_player;

auto make_roster(std::size_t count, gender g = gender::other) -> std::vector<player>
{
	std::vector<player> roster;
	for (std::size_t i = 0; i < count; ++i)
		roster.push_back(make_player("p" + std::to_string(i + 1), "Player " + std::to_string(i + 1), g, static_cast<double>(i % 10)));
	return roster;
}

auto team_of(const assignment_result &r, const std::string &id) -> std::string
{
	auto it = r.assignment.find(id);
	return it == r.assignment.end() ? std::string{} : it->second;
}

auto total_players(const assignment_result &r) -> std::size_t
{
	std::size_t n = r.unassigned.size();
	for (const auto &t : r.teams)
		n += t.size();
	return n;
}

TEST(ConstraintAssignerTest, UnitsFollowPriority) {
	auto roster = make_roster(6);
	roster[3].avoid_requests = {"x", "y"};

	std::vector<player_group> custom(1);
	custom[0] = {.id = "custom-1", .player_ids = {"p1", "p2", "ghost"}};
	std::vector<player_group> formed(2);
	formed[0] = {.id = "group-0", .player_ids = {"p2", "p3"}};
	formed[1] = {.id = "group-1", .player_ids = {"p4", "p5"}};

	const auto units = constraint_assigner::build_units(roster, custom, formed);

	ASSERT_EQ(units.size(), 4u);
	EXPECT_EQ(units[0].priority, 1);
	EXPECT_EQ(units[0].group_id, "custom-1");
	EXPECT_EQ(units[0].members, (std::vector<std::size_t>{0, 1}));

	EXPECT_EQ(units[1].priority, 2);
	EXPECT_EQ(units[1].group_id, "group-1");
	EXPECT_EQ(units[1].avoid_count, 2u);

	EXPECT_EQ(units[2].priority, 3);
	EXPECT_EQ(units[2].members, std::vector<std::size_t>{2});
	EXPECT_EQ(units[3].members, std::vector<std::size_t>{5});
	EXPECT_FALSE(units[3].group_id.has_value());
}

TEST(ConstraintAssignerTest, GroupIsPlacedWhole) {
	const auto roster = make_roster(6);
	std::vector<player_group> formed(1);
	formed[0] = {.id = "group-0", .player_ids = {"p2", "p4", "p6"}};

	const auto config = make_config(3, 2);
	avoid_graph avoids;
	std::mt19937_64 rng{42};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, {}, formed), generation_mode::balanced);

	EXPECT_TRUE(result.unassigned.empty());
	ASSERT_FALSE(team_of(result, "p2").empty());
	EXPECT_EQ(team_of(result, "p2"), team_of(result, "p4"));
	EXPECT_EQ(team_of(result, "p2"), team_of(result, "p6"));
	for (const auto &t : result.teams) {
		EXPECT_LE(t.size(), 3u);
		for (const auto &p : t.players)
			EXPECT_EQ(p.team_id, t.id);
	}
}

TEST(ConstraintAssignerTest, AvoidPairNeverShareATeam) {
	// Scenario B: one slot, capacity would otherwise force them together
	std::vector<player> roster{make_player("x", "Xavier", gender::male, 5.0, {}, {"Yolanda"}), make_player("y", "Yolanda", gender::female, 5.0)};

	avoid_graph avoids;
	avoids.add("x", "y");
	const auto config = make_config(2, 1);
	std::mt19937_64 rng{7};
	constraint_assigner assigner(config, avoids, rng);

	for (auto mode : {generation_mode::balanced, generation_mode::randomized}) {
		const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, {}, {}), mode);
		const auto tx = team_of(result, "x");
		const auto ty = team_of(result, "y");
		EXPECT_TRUE(tx.empty() || ty.empty() || tx != ty);
		EXPECT_GE(result.unassigned.size(), 1u);
		EXPECT_EQ(total_players(result), 2u);
	}
}

TEST(ConstraintAssignerTest, CustomGroupOfThreeWithSingletons) {
	// Scenario C
	const auto roster = make_roster(12);
	std::vector<player_group> custom(1);
	custom[0] = {.id = "custom-1", .player_ids = {"p1", "p5", "p9"}};

	const auto config = make_config(4, 3);
	avoid_graph avoids;
	std::mt19937_64 rng{1};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, custom, {}), generation_mode::balanced);

	EXPECT_TRUE(result.unassigned.empty());
	const auto home = team_of(result, "p1");
	ASSERT_FALSE(home.empty());
	EXPECT_EQ(team_of(result, "p5"), home);
	EXPECT_EQ(team_of(result, "p9"), home);

	auto it = std::ranges::find(result.teams, home, &team::id);
	ASSERT_NE(it, result.teams.end());
	EXPECT_LE(it->size(), 4u);
	EXPECT_EQ(result.teams.size(), 3u);
}

TEST(ConstraintAssignerTest, ManualModeLeavesEveryoneUnassigned) {
	// Scenario E
	const auto roster = make_roster(10);
	std::vector<player_group> formed(1);
	formed[0] = {.id = "group-0", .player_ids = {"p1", "p2"}};

	const auto config = make_config(4, 3);
	avoid_graph avoids;
	std::mt19937_64 rng{3};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, {}, formed), generation_mode::manual);

	ASSERT_EQ(result.teams.size(), 3u);
	for (const auto &t : result.teams)
		EXPECT_TRUE(t.empty());
	EXPECT_EQ(result.teams[0].id, "team-1");
	EXPECT_EQ(result.teams[2].name, "Team 3");
	EXPECT_EQ(result.unassigned.size(), 10u);
	EXPECT_TRUE(result.assignment.empty());
}

TEST(ConstraintAssignerTest, QuotaStaysAchievable) {
	std::vector<player> roster{make_player("m1", "Mark", gender::male), make_player("m2", "Neil", gender::male), make_player("m3", "Oscar", gender::male),
														 make_player("f1", "Fay", gender::female)};

	const auto config = make_config(2, 2, 1, 0);
	avoid_graph avoids;
	std::mt19937_64 rng{5};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, {}, {}), generation_mode::balanced);

	for (const auto &t : result.teams) {
		EXPECT_LE(t.genders.male, 1);
		EXPECT_TRUE(quota_achievable(t.genders, t.size(), config));
	}
	EXPECT_EQ(result.unassigned.size(), 1u);
	EXPECT_EQ(total_players(result), 4u);
}

TEST(ConstraintAssignerTest, SingleGenderTeamsWhenMixingIsOff) {
	std::vector<player> roster{make_player("m1", "Mark", gender::male), make_player("f1", "Fay", gender::female), make_player("m2", "Neil", gender::male),
														 make_player("f2", "Gina", gender::female)};

	auto config = make_config(4, 2);
	config.allow_mixed_gender = false;
	avoid_graph avoids;
	std::mt19937_64 rng{9};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, {}, {}), generation_mode::balanced);

	EXPECT_TRUE(result.unassigned.empty());
	for (const auto &t : result.teams)
		EXPECT_TRUE(t.genders.male == 0 || t.genders.female == 0);
}

TEST(ConstraintAssignerTest, BalancedPrefersSmallestTeam) {
	std::vector<player> roster{make_player("a", "Ann", gender::other, 9.0), make_player("b", "Ben", gender::other, 1.0),
														 make_player("c", "Cal", gender::other, 5.0), make_player("d", "Dee", gender::other, 5.0)};

	const auto config = make_config(2, 2);
	avoid_graph avoids;
	std::mt19937_64 rng{11};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, constraint_assigner::build_units(roster, {}, {}), generation_mode::balanced);

	ASSERT_EQ(result.teams.size(), 2u);
	EXPECT_EQ(result.teams[0].size(), 2u);
	EXPECT_EQ(result.teams[1].size(), 2u);
	EXPECT_NE(team_of(result, "a"), team_of(result, "b"));
}

TEST(ConstraintAssignerTest, RandomizedIsReproducibleWithSeed) {
	const auto roster = make_roster(20);
	const auto config = make_config(5);
	avoid_graph avoids;
	avoids.add("p1", "p2");
	const auto units = constraint_assigner::build_units(roster, {}, {});

	std::mt19937_64 rng_a{1234};
	std::mt19937_64 rng_b{1234};
	const auto a = constraint_assigner(config, avoids, rng_a).assign(roster, units, generation_mode::randomized);
	const auto b = constraint_assigner(config, avoids, rng_b).assign(roster, units, generation_mode::randomized);

	EXPECT_EQ(a.assignment, b.assignment);
	EXPECT_EQ(total_players(a), 20u);
	for (const auto &t : a.teams)
		EXPECT_LE(t.size(), 5u);
	const auto t1 = team_of(a, "p1");
	EXPECT_TRUE(t1.empty() || t1 != team_of(a, "p2"));
}

TEST(ConstraintAssignerTest, EmptyRosterGivesNoTeams) {
	const std::vector<player> roster;
	const auto config = make_config(4);
	avoid_graph avoids;
	std::mt19937_64 rng{1};
	constraint_assigner assigner(config, avoids, rng);

	const auto result = assigner.assign(roster, {}, generation_mode::balanced);
	EXPECT_TRUE(result.teams.empty());
	EXPECT_TRUE(result.unassigned.empty());
}

TEST(ConstraintAssignerTest, ModeNames) {
	EXPECT_EQ(generation_mode_from_string("Random"), generation_mode::randomized);
	EXPECT_EQ(generation_mode_from_string("balanced"), generation_mode::balanced);
	EXPECT_EQ(generation_mode_from_string("manual"), generation_mode::manual);
	EXPECT_FALSE(generation_mode_from_string("chaos").has_value());
	EXPECT_EQ(to_string(generation_mode::randomized), "random");
}

} // namespace
} // namespace teamforge
