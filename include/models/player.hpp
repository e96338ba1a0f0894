#pragma once

#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace teamforge {

enum class gender { male, female, other };

[[nodiscard]] inline auto to_string(gender g) -> std::string_view
{
	switch (g) {
	case gender::male:
		return "M";
	case gender::female:
		return "F";
	case gender::other:
		break;
	}
	return "Other";
}

// Unknown spellings fall back to Other, the same default the roster importer used.
[[nodiscard]] inline auto gender_from_string(std::string_view s) -> gender
{
	const auto key = util::normalize(s);
	if (key == "m" || key == "male")
		return gender::male;
	if (key == "f" || key == "female")
		return gender::female;
	return gender::other;
}

enum class request_priority { must_have, nice_to_have };

[[nodiscard]] inline auto to_string(request_priority p) -> std::string_view { return p == request_priority::must_have ? "must-have" : "nice-to-have"; }

[[nodiscard]] inline auto priority_for_index(std::size_t index) -> request_priority { return index == 0 ? request_priority::must_have : request_priority::nice_to_have; }

enum class request_outcome { honored, conflict, group_full, non_reciprocal, not_found };

[[nodiscard]] inline auto to_string(request_outcome o) -> std::string_view
{
	switch (o) {
	case request_outcome::honored:
		return "honored";
	case request_outcome::conflict:
		return "conflict";
	case request_outcome::group_full:
		return "group-full";
	case request_outcome::non_reciprocal:
		return "non-reciprocal";
	case request_outcome::not_found:
		break;
	}
	return "not-found";
}

[[nodiscard]] inline auto request_outcome_from_string(std::string_view s) -> request_outcome
{
	if (s == "honored")
		return request_outcome::honored;
	if (s == "conflict")
		return request_outcome::conflict;
	if (s == "group-full")
		return request_outcome::group_full;
	if (s == "non-reciprocal")
		return request_outcome::non_reciprocal;
	return request_outcome::not_found;
}

struct unfulfilled_request {
	std::string name;
	request_outcome reason{request_outcome::non_reciprocal};
	request_priority priority{request_priority::nice_to_have};

	[[nodiscard]] auto operator==(const unfulfilled_request &) const -> bool = default;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"name", self.name}, {"reason", std::string{to_string(self.reason)}}, {"priority", std::string{to_string(self.priority)}}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> unfulfilled_request
	{
		return {.name = j.at("name").get<std::string>(),
						.reason = request_outcome_from_string(j.value("reason", std::string{"non-reciprocal"})),
						.priority = j.value("priority", std::string{"nice-to-have"}) == "must-have" ? request_priority::must_have : request_priority::nice_to_have};
	}
};

class player {
public:
	std::string id;
	std::string name;
	teamforge::gender gender{teamforge::gender::other};
	double skill_rating{};
	std::optional<double> exec_skill_rating{}; // overrides skill_rating when present
	std::vector<std::string> teammate_requests;
	std::vector<std::string> avoid_requests;
	std::optional<std::string> team_id{};
	std::optional<std::string> group_id{};
	std::optional<std::string> email{};
	std::optional<bool> is_handler{};
	std::vector<unfulfilled_request> unfulfilled_requests;

	[[nodiscard]] auto operator==(const player &) const -> bool = default;

	[[nodiscard]] auto effective_skill(this const auto &self) -> double { return self.exec_skill_rating.value_or(self.skill_rating); }

	[[nodiscard]] auto handler(this const auto &self) -> bool { return self.is_handler.value_or(false); }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json out{{"id", self.id},
											 {"name", self.name},
											 {"gender", std::string{to_string(self.gender)}},
											 {"skillRating", self.skill_rating},
											 {"execSkillRating", nullptr},
											 {"teammateRequests", self.teammate_requests},
											 {"avoidRequests", self.avoid_requests}};
		if (self.exec_skill_rating)
			out["execSkillRating"] = *self.exec_skill_rating;
		if (self.team_id)
			out["teamId"] = *self.team_id;
		if (self.group_id)
			out["groupId"] = *self.group_id;
		if (self.email)
			out["email"] = *self.email;
		if (self.is_handler)
			out["isHandler"] = *self.is_handler;
		if (!self.unfulfilled_requests.empty()) {
			out["unfulfilledRequests"] = nlohmann::json::array();
			for (const auto &u : self.unfulfilled_requests)
				out["unfulfilledRequests"].push_back(u.to_json());
		}
		return out;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> player
	{
		player p;
		p.id = j.at("id").get<std::string>();
		p.name = j.at("name").get<std::string>();
		p.gender = gender_from_string(j.value("gender", std::string{"Other"}));
		p.skill_rating = j.value("skillRating", 0.0);
		if (auto it = j.find("execSkillRating"); it != j.end() && it->is_number())
			p.exec_skill_rating = it->get<double>();
		p.teammate_requests = j.value("teammateRequests", std::vector<std::string>{});
		p.avoid_requests = j.value("avoidRequests", std::vector<std::string>{});
		if (auto it = j.find("teamId"); it != j.end() && it->is_string())
			p.team_id = it->get<std::string>();
		if (auto it = j.find("groupId"); it != j.end() && it->is_string())
			p.group_id = it->get<std::string>();
		if (auto it = j.find("email"); it != j.end() && it->is_string())
			p.email = it->get<std::string>();
		if (auto it = j.find("isHandler"); it != j.end() && it->is_boolean())
			p.is_handler = it->get<bool>();
		if (auto it = j.find("unfulfilledRequests"); it != j.end() && it->is_array()) {
			for (const auto &uj : *it)
				p.unfulfilled_requests.push_back(unfulfilled_request::from_json(uj));
		}
		return p;
	}
};

} // namespace teamforge
