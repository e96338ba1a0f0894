#include "services/roster_io.hpp"
#include "services/team_generator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace teamforge {
namespace {

using test_support::make_config;
using test_support::make_player;

class RosterIoTest : public ::testing::Test {
protected:
	std::filesystem::path dir;

	void SetUp() override
	{
		const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
		dir = std::filesystem::temp_directory_path() / (std::string{"teamforge_"} + info->name());
		std::filesystem::create_directories(dir);
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove_all(dir, ec);
	}

	auto write(const std::string &name, const std::string &content) -> std::filesystem::path
	{
		const auto path = dir / name;
		std::ofstream(path) << content;
		return path;
	}
};

TEST_F(RosterIoTest, LoadsBareArrayOfPlayers) {
	const auto path = write("players.json", R"([
		{"id": "p1", "name": "Alice Walker", "gender": "F", "skillRating": 7, "teammateRequests": ["Brian Cooper"]},
		{"id": "p2", "name": "Brian Cooper", "gender": "M", "skillRating": 4.5, "execSkillRating": 6}
	])");

	const auto players = roster_io::load_players(path);
	ASSERT_TRUE(players.has_value()) << players.error().message;
	ASSERT_EQ(players->size(), 2u);
	EXPECT_EQ((*players)[0].gender, gender::female);
	EXPECT_EQ((*players)[0].teammate_requests.size(), 1u);
	EXPECT_DOUBLE_EQ((*players)[1].effective_skill(), 6.0);
}

TEST_F(RosterIoTest, LoadsPlayersFromObject) {
	const auto path = write("roster.json", R"({"players": [{"id": "p1", "name": "Alice Walker"}]})");

	const auto players = roster_io::load_players(path);
	ASSERT_TRUE(players.has_value());
	EXPECT_EQ(players->size(), 1u);
}

TEST_F(RosterIoTest, MissingFileIsAnError) {
	const auto players = roster_io::load_players(dir / "nope.json");
	ASSERT_FALSE(players.has_value());
	EXPECT_NE(players.error().message.find("File not found"), std::string::npos);
}

TEST_F(RosterIoTest, MalformedJsonIsAnError) {
	EXPECT_FALSE(roster_io::load_players(write("bad.json", "[{\"id\": ")).has_value());
	EXPECT_FALSE(roster_io::load_players(write("noname.json", R"([{"id": "p1"}])")).has_value());
	EXPECT_FALSE(roster_io::load_players(write("nokey.json", R"({"roster": []})")).has_value());
	EXPECT_FALSE(roster_io::load_players(write("scalar.json", "42")).has_value());
}

TEST_F(RosterIoTest, LoadsConfigAndGroups) {
	const auto config = roster_io::load_config(write("config.json", R"({"name": "Spring", "maxTeamSize": 7, "minFemales": 2, "targetTeams": 4})"));
	ASSERT_TRUE(config.has_value());
	EXPECT_EQ(config->name, "Spring");
	EXPECT_EQ(config->max_team_size, 7);
	EXPECT_EQ(config->min_females, 2);
	EXPECT_EQ(config->target_teams, 4);

	const auto groups = roster_io::load_groups(write("groups.json", R"({"playerGroups": [{"id": "custom-1", "label": "Q", "playerIds": ["p1", "p2"]}]})"));
	ASSERT_TRUE(groups.has_value());
	ASSERT_EQ(groups->size(), 1u);
	EXPECT_EQ((*groups)[0].label, "Q");
	EXPECT_EQ((*groups)[0].player_ids.size(), 2u);

	EXPECT_FALSE(roster_io::load_groups(write("badgroups.json", R"([{"label": "Q"}])")).has_value());
}

TEST_F(RosterIoTest, SavedResultIsReadableJson) {
	const std::vector<player> roster{make_player("p1", "Alice Walker", gender::female, 6.0), make_player("p2", "Brian Cooper", gender::male, 4.0)};
	team_generator generator({.seed = 17});
	const auto result = generator.generate(roster, make_config(2));

	const auto path = dir / "result.json";
	ASSERT_TRUE(roster_io::save_result(path, result).has_value());

	std::ifstream in(path);
	const auto j = nlohmann::json::parse(in);
	EXPECT_EQ(j.at("seed").get<std::uint64_t>(), 17u);
	EXPECT_EQ(j.at("teams").size(), 1u);
	EXPECT_EQ(j.at("stats").at("totalPlayers").get<std::size_t>(), 2u);
	EXPECT_EQ(j.at("config").at("maxTeamSize").get<int>(), 2);
}

} // namespace
} // namespace teamforge
