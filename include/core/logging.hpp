/**
 * @brief
 * Callback-style logging shared by all services.
 * A service holds a log_sink and stays silent when it is empty; the driver
 * installs cout_logger(), mirroring how the bot wired on_log(cout_logger()).
 */

#pragma once

#include <format>
#include <functional>
#include <string_view>
#include <utility>

namespace teamforge {

enum class log_level { debug, info, warning, error };

using log_sink = std::function<void(log_level, std::string_view)>;

[[nodiscard]] auto to_string(log_level level) -> std::string_view;

/** @brief Sink that writes "[teamforge] LEVEL: message" lines to std::clog, dropping anything below min_level. */
[[nodiscard]] auto cout_logger(log_level min_level = log_level::info) -> log_sink;

// Format and forward to the sink if one is installed.
template <typename... Args>
auto log(const log_sink &sink, log_level level, std::format_string<Args...> fmt, Args &&...args) -> void
{
	if (!sink)
		return;
	sink(level, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace teamforge
