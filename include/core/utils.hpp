#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace teamforge {

namespace type {
// Error handling
struct error {
	std::string message;

	error(std::string_view sv) : message(sv) {}
	error(std::string s) : message(std::move(s)) {}
	error(const char *s) : message(s) {}

	error() = default;
	error(const error &) = default;
	error(error &&) noexcept = default;
	error &operator=(const error &) = default;
	error &operator=(error &&) noexcept = default;

	// explicit object parameter
	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
};

using ok_t = std::monostate;
} // namespace type

namespace util {
// ASCII lowercase copy; names are compared case-insensitively everywhere.
[[nodiscard]] inline auto to_lower(std::string_view sv) -> std::string
{
	std::string out{sv};
	std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

[[nodiscard]] inline auto trim(std::string_view sv) -> std::string_view
{
	const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
	while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
		sv.remove_prefix(1);
	while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
		sv.remove_suffix(1);
	return sv;
}

// trim + lowercase, the key form used for name lookups.
[[nodiscard]] inline auto normalize(std::string_view sv) -> std::string { return to_lower(trim(sv)); }

// Checked narrowing: throws if the value does not fit.
template <std::integral To, std::integral From>
[[nodiscard]] constexpr To narrow(From v)
{
	if (!std::in_range<To>(v)) {
		throw std::out_of_range("narrow(): value out of range");
	}

	return static_cast<To>(v);
}

} // namespace util

} // namespace teamforge
