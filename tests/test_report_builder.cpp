#include "services/team_generator.hpp"
#include "test_helpers.hpp"
#include "ui/report_builder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace teamforge {
namespace {

using test_support::make_config;
using test_support::make_player;

TEST(ReportBuilderTest, ListsTeamsAndStats) {
	std::vector<player> roster{
			make_player("p1", "Alice Walker", gender::female, 7.0, {"Brian Cooper"}),
			make_player("p2", "Brian Cooper", gender::male, 3.0, {"Alice Walker"}),
			make_player("p3", "Chloe Davis", gender::female, 6.0, {"Xyzzy Qwv"}),
	};
	roster[2].is_handler = true;

	team_generator generator({.seed = 12});
	const auto result = generator.generate(roster, make_config(2, 2));
	const auto report = ui::report_builder::build_report(result);

	EXPECT_NE(report.find("balanced mode, seed 12"), std::string::npos);
	EXPECT_NE(report.find("Team 1"), std::string::npos);
	EXPECT_NE(report.find("Alice Walker [F] 7.0 <group-0>"), std::string::npos);
	EXPECT_NE(report.find("Chloe Davis [F] 6.0 (handler)"), std::string::npos);
	EXPECT_NE(report.find("[error] "), std::string::npos);
	EXPECT_NE(report.find("Players: 3 total, 3 assigned, 0 unassigned"), std::string::npos);
	EXPECT_NE(report.find("Skill spread:"), std::string::npos);
}

TEST(ReportBuilderTest, ValidationPrefixes) {
	group_validation v;
	v.errors.emplace_back("too big");
	v.warnings.emplace_back("fills a team");

	EXPECT_EQ(ui::report_builder::build_validation(v), "[error] too big\n[warn] fills a team\n");
	EXPECT_EQ(ui::report_builder::build_teams({}), "No teams.\n\n");
	EXPECT_TRUE(ui::report_builder::build_unassigned({}).empty());
}

} // namespace
} // namespace teamforge
