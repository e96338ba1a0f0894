#include "services/stats_collector.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

namespace teamforge {
namespace {

using test_support::make_player;

struct stats_fixture : ::testing::Test {
	std::vector<player> roster{
			make_player("p1", "Alice Walker", gender::female, 6.0, {"Brian Cooper", "Chloe Davis"}),
			make_player("p2", "Brian Cooper", gender::male, 4.0, {"Alice Walker"}),
			make_player("p3", "Chloe Davis", gender::female, 5.0, {"Xyzzy Qwv"}),
			make_player("p4", "Derek Evans", gender::male, 5.0),
	};
	std::vector<team> teams;
	std::vector<player> unassigned;
	std::vector<player_group> groups;
	avoid_graph avoids;
	name_resolver resolver;

	void SetUp() override
	{
		auto t1 = make_team(1);
		t1.add_player(roster[0]);
		t1.add_player(roster[1]);
		auto t2 = make_team(2);
		t2.add_player(roster[2]);
		teams = {t1, t2};
		unassigned = {roster[3]};

		groups.resize(2);
		groups[0] = {.id = "group-0", .label = "A", .player_ids = {"p1", "p2"}};
		groups[1] = {.id = "group-1", .label = "B", .player_ids = {"p3", "p4"}};

		avoids.add("p1", "p2");
	}
};

TEST_F(stats_fixture, CountsPlayersRequestsAndGroups) {
	stats_collector collector(resolver);
	const auto stats = collector.collect(roster, teams, unassigned, groups, avoids, 3, std::chrono::milliseconds{12});

	EXPECT_EQ(stats.total_players, 4u);
	EXPECT_EQ(stats.assigned_players, 3u);
	EXPECT_EQ(stats.unassigned_players, 1u);

	EXPECT_EQ(stats.must_have_honored, 2u);
	EXPECT_EQ(stats.must_have_broken, 0u);
	EXPECT_EQ(stats.nice_to_have_honored, 0u);
	EXPECT_EQ(stats.nice_to_have_broken, 1u);
	EXPECT_EQ(stats.requests_honored(), 2u);
	EXPECT_EQ(stats.requests_broken(), 1u);

	EXPECT_EQ(stats.groups_intact, 1u);
	EXPECT_EQ(stats.groups_broken, 1u);

	EXPECT_EQ(stats.conflicts_detected, 3u);
	EXPECT_EQ(stats.avoid_violations, 1u);
	EXPECT_EQ(stats.generation_time, std::chrono::milliseconds{12});
}

TEST_F(stats_fixture, UnassignedGroupStaysIntact) {
	teams.pop_back();
	unassigned = {roster[2], roster[3]};

	stats_collector collector(resolver);
	const auto stats = collector.collect(roster, teams, unassigned, groups, avoids, 0, std::chrono::milliseconds{1});

	EXPECT_EQ(stats.groups_intact, 2u);
	EXPECT_EQ(stats.groups_broken, 0u);
	EXPECT_EQ(stats.unassigned_players, 2u);
}

TEST_F(stats_fixture, CollectingTwiceGivesTheSameRecord) {
	stats_collector collector(resolver);
	const auto first = collector.collect(roster, teams, unassigned, groups, avoids, 0, std::chrono::milliseconds{5});
	const auto second = collector.collect(roster, teams, unassigned, groups, avoids, 0, std::chrono::milliseconds{5});
	EXPECT_EQ(first, second);
}

TEST_F(stats_fixture, JsonUsesCamelCaseKeys) {
	stats_collector collector(resolver);
	const auto j = collector.collect(roster, teams, unassigned, groups, avoids, 0, std::chrono::milliseconds{5}).to_json();

	EXPECT_EQ(j.at("totalPlayers").get<std::size_t>(), 4u);
	EXPECT_EQ(j.at("avoidRequestsViolated").get<std::size_t>(), 1u);
	EXPECT_EQ(j.at("generationTime").get<long long>(), 5);
}

} // namespace
} // namespace teamforge
