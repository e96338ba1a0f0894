#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace teamforge::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_player = "Player not found";
inline constexpr std::string_view unknown_team = "Team not found";
inline constexpr std::string_view unknown_group = "Group not found";
inline constexpr std::string_view team_full = "Destination team is full";
inline constexpr std::string_view avoid_conflict = "Move would put players who avoid each other on the same team";
inline constexpr std::string_view group_split = "Move would split a player group; force the move to override";
inline constexpr std::string_view config_name_required = "Config name is required";
inline constexpr std::string_view team_size_too_small = "Max team size must be at least 1";
inline constexpr std::string_view team_size_too_large = "Max team size cannot exceed 50";
inline constexpr std::string_view min_females_negative = "Minimum females cannot be negative";
inline constexpr std::string_view min_males_negative = "Minimum males cannot be negative";
inline constexpr std::string_view quota_exceeds_size = "Minimum gender requirements exceed max team size";
inline constexpr std::string_view target_teams_too_small = "Target teams must be at least 1";
inline constexpr std::string_view group_too_large_reason = "group-too-large";

inline constexpr std::string_view warn_prefix = "[warn] ";
inline constexpr std::string_view err_prefix = "[error] ";
} // namespace text

// Limits
namespace limits {
inline constexpr std::size_t max_group_size = 4;
inline constexpr int min_team_size = 1;
inline constexpr int max_team_size = 50;
inline constexpr std::size_t default_suggestion_limit = 5;
} // namespace limits

// League defaults
namespace defaults {
inline constexpr std::string_view config_id = "default";
inline constexpr std::string_view config_name = "Default League";
inline constexpr int max_team_size = 12;
inline constexpr int min_females = 0;
inline constexpr int min_males = 0;
} // namespace defaults

// Name-matching thresholds
namespace matching {
inline constexpr double default_threshold = 0.6;
inline constexpr double stats_threshold = 0.8;
inline constexpr double suggestion_threshold = 0.3;
inline constexpr double likely_match_threshold = 0.8;
inline constexpr double material_gain = 0.05;

inline constexpr double exact_score = 1.0;
inline constexpr double case_insensitive_score = 0.95;
inline constexpr double nickname_score = 0.9;
inline constexpr double concatenated_score = 0.85;
inline constexpr double concatenation_pattern_score = 0.82;
inline constexpr double phonetic_score = 0.8;
inline constexpr double high_similarity = 0.8;
inline constexpr double medium_similarity = 0.6;
inline constexpr double partial_min_ratio = 0.5;
inline constexpr double partial_weight = 0.7;
} // namespace matching

// Skill balancer defaults
namespace balance {
inline constexpr int max_passes = 10;
inline constexpr double spread_threshold = 0.5;
inline constexpr std::size_t sample_size = 4;
inline constexpr double min_improvement = 0.01;
inline constexpr int handler_target = 2;
inline constexpr double role_weight = 0.25;
} // namespace balance

// Group palette, cycled by group index
inline constexpr std::array<std::string_view, 12> group_colors = {
		"#3B82F6", // Blue
		"#EF4444", // Red
		"#10B981", // Green
		"#F59E0B", // Yellow
		"#8B5CF6", // Purple
		"#F97316", // Orange
		"#06B6D4", // Cyan
		"#84CC16", // Lime
		"#EC4899", // Pink
		"#6B7280", // Gray
		"#14B8A6", // Teal
		"#F43F5E", // Rose
};

} // namespace teamforge::constants
