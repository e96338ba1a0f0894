#include "core/logging.hpp"
#include "services/group_formation.hpp"
#include "services/roster_io.hpp"
#include "services/team_generator.hpp"
#include "ui/report_builder.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace teamforge;

namespace {

struct cli_args {
	std::string players_path;
	std::optional<std::string> config_path;
	std::optional<std::string> groups_path;
	std::optional<std::string> out_path;
	generation_mode mode{generation_mode::balanced};
	std::uint64_t seed{0};
	bool quiet{false};
};

constexpr std::string_view usage =
		"Usage: teamforge <players.json> [--config file] [--groups file] [--mode balanced|random|manual] [--seed N] [--out file] [--quiet]";

auto parse_args(int argc, char **argv) -> std::expected<cli_args, type::error>
{
	cli_args args;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];

		const auto next = [&]() -> std::optional<std::string> {
			if (i + 1 >= argc)
				return std::nullopt;
			return std::string{argv[++i]};
		};

		if (arg == "--config" || arg == "--groups" || arg == "--out" || arg == "--mode" || arg == "--seed") {
			auto value = next();
			if (!value)
				return std::unexpected(type::error{std::format("Missing value for {}", arg)});

			if (arg == "--config")
				args.config_path = *value;
			else if (arg == "--groups")
				args.groups_path = *value;
			else if (arg == "--out")
				args.out_path = *value;
			else if (arg == "--mode") {
				auto mode = generation_mode_from_string(*value);
				if (!mode)
					return std::unexpected(type::error{std::format("Unknown mode: {}", *value)});
				args.mode = *mode;
			}
			else {
				auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), args.seed);
				if (ec != std::errc{} || ptr != value->data() + value->size())
					return std::unexpected(type::error{std::format("Invalid seed: {}", *value)});
			}
		}
		else if (arg == "--quiet") {
			args.quiet = true;
		}
		else if (arg.starts_with("--")) {
			return std::unexpected(type::error{std::format("Unknown option: {}", arg)});
		}
		else if (args.players_path.empty()) {
			args.players_path = std::string{arg};
		}
		else {
			return std::unexpected(type::error{std::format("Unexpected argument: {}", arg)});
		}
	}

	if (args.players_path.empty())
		return std::unexpected(type::error{"Missing players file"});
	return args;
}

} // namespace

int main(int argc, char **argv)
{
	auto args = parse_args(argc, argv);
	if (!args) {
		std::cerr << "[teamforge] " << args.error().what() << "\n" << usage << "\n";
		return 1;
	}

	// Load data
	auto players = roster_io::load_players(args->players_path);
	if (!players) {
		std::cerr << "[teamforge] " << players.error().what() << "\n";
		return 1;
	}

	league_config config;
	if (args->config_path) {
		auto loaded = roster_io::load_config(*args->config_path);
		if (!loaded) {
			std::cerr << "[teamforge] " << loaded.error().what() << "\n";
			return 1;
		}
		config = std::move(*loaded);
	}

	if (auto res = config.validate(); !res) {
		std::cerr << "[teamforge] Invalid config:\n" << res.error().what() << "\n";
		return 1;
	}

	std::vector<player_group> groups;
	if (args->groups_path) {
		auto loaded = roster_io::load_groups(*args->groups_path);
		if (!loaded) {
			std::cerr << "[teamforge] " << loaded.error().what() << "\n";
			return 1;
		}
		groups = std::move(*loaded);
	}

	const auto validation = validate_groups_for_generation(groups, config.max_team_size);
	std::cerr << ui::report_builder::build_validation(validation);
	if (!validation.ok())
		return 1;

	// Run
	generation_options options;
	options.mode = args->mode;
	options.seed = args->seed;
	if (!args->quiet)
		options.log = cout_logger();

	team_generator generator(std::move(options));
	const auto result = generator.generate(*players, config, groups);

	std::cout << ui::report_builder::build_report(result);

	// Save
	if (args->out_path) {
		if (auto res = roster_io::save_result(*args->out_path, result); !res) {
			std::cerr << "[teamforge] Save error: " << res.error().what() << "\n";
			return 1;
		}
	}

	return 0;
}
