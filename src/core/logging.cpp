#include "core/logging.hpp"

#include <iostream>

namespace teamforge {

auto to_string(log_level level) -> std::string_view
{
	switch (level) {
	case log_level::debug:
		return "DEBUG";
	case log_level::info:
		return "INFO";
	case log_level::warning:
		return "WARNING";
	case log_level::error:
		break;
	}
	return "ERROR";
}

auto cout_logger(log_level min_level) -> log_sink
{
	return [min_level](log_level level, std::string_view message) {
		if (level < min_level)
			return;
		std::clog << "[teamforge] " << to_string(level) << ": " << message << '\n';
	};
}

} // namespace teamforge
