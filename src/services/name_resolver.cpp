/**
 * @brief
 * Name matching cascade, in order:
 *   exact -> concatenation -> nickname table -> Soundex -> Levenshtein -> substring.
 * The first check that fires sets the result; a later check only replaces it
 * when it scores more than `material_gain` higher.
 */

#include "services/name_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <numeric>
#include <ranges>

namespace {

struct nickname_entry {
	std::string_view base;
	std::vector<std::string_view> formal;
	std::vector<std::string_view> nicknames;
	std::vector<std::string_view> diminutives;
};

// Curated formal <-> nickname table.
const std::vector<nickname_entry> nickname_table{
		{"alexander", {"Alexander"}, {"Alex", "Alec", "Xander", "Lex", "Al"}, {"Sandy", "Sasha"}},
		{"alexandra", {"Alexandra"}, {"Alex", "Alexa", "Lexi", "Lexie", "Sandra", "Allie"}, {"Sandy", "Sasha"}},
		{"andrew", {"Andrew"}, {"Andy", "Drew"}, {"Anders"}},
		{"anthony", {"Anthony"}, {"Tony", "Ant"}, {"Anton"}},
		{"benjamin", {"Benjamin"}, {"Ben", "Benny"}, {"Benji"}},
		{"bridget", {"Bridget"}, {"Bri", "Bridge"}, {"Birdie"}},
		{"brianna", {"Brianna"}, {"Bri", "Bree"}, {"Anna"}},
		{"catherine", {"Catherine", "Katherine"}, {"Cat", "Cathy", "Kate", "Katie", "Kitty"}, {"Cate"}},
		{"charles", {"Charles"}, {"Charlie", "Chuck"}, {"Chas"}},
		{"christopher", {"Christopher"}, {"Chris", "Kit", "Topher"}, {"Christie"}},
		{"daniel", {"Daniel"}, {"Dan", "Danny"}, {"Dani"}},
		{"david", {"David"}, {"Dave", "Davey"}, {"Davy"}},
		{"deborah", {"Deborah"}, {"Deb", "Debbie", "Debby"}, {"Debs"}},
		{"edward", {"Edward"}, {"Ed", "Eddie", "Ted"}, {"Ned"}},
		{"elizabeth", {"Elizabeth"}, {"Liz", "Beth", "Betsy", "Eliza", "Libby", "Betty"}, {"Lizzie", "Liza"}},
		{"gregory", {"Gregory"}, {"Greg", "Gregg"}, {"Gregor"}},
		{"james", {"James"}, {"Jim", "Jimmy", "Jamie"}, {"Jimbo"}},
		{"jennifer", {"Jennifer"}, {"Jen", "Jenny", "Jenni"}, {"Jenna"}},
		{"jessica", {"Jessica"}, {"Jess", "Jessie"}, {"Jessi"}},
		{"jonathan", {"Jonathan"}, {"Jon", "Johnny", "Nathan"}, {"Jonny"}},
		{"joseph", {"Joseph"}, {"Joe", "Joey"}, {"Jo"}},
		{"kenneth", {"Kenneth"}, {"Ken", "Kenny"}, {}},
		{"kimberly", {"Kimberly"}, {"Kim", "Kimmy"}, {"Kimber"}},
		{"margaret", {"Margaret"}, {"Maggie", "Meg", "Peggy"}, {"Marge"}},
		{"matthew", {"Matthew"}, {"Matt", "Matty"}, {"Mat"}},
		{"michael", {"Michael"}, {"Mike", "Mick", "Mickey", "Mikey"}, {"Mitch"}},
		{"nicholas", {"Nicholas"}, {"Nick", "Nicky", "Cole"}, {"Nico"}},
		{"patricia", {"Patricia"}, {"Pat", "Patty", "Patsy", "Tricia"}, {"Patti"}},
		{"peter", {"Peter"}, {"Pete"}, {"Petey"}},
		{"rebecca", {"Rebecca"}, {"Becca", "Becky"}, {"Reba"}},
		{"richard", {"Richard"}, {"Rick", "Dick", "Rich", "Richie"}, {"Ricky"}},
		{"robert", {"Robert"}, {"Rob", "Bob", "Bobby", "Robbie", "Bert"}, {"Robby"}},
		{"ronald", {"Ronald"}, {"Ron", "Ronnie"}, {"Ronny"}},
		{"samantha", {"Samantha"}, {"Sam", "Sammy"}, {}},
		{"stephanie", {"Stephanie"}, {"Steph", "Steffi"}, {}},
		{"steven", {"Steven", "Stephen"}, {"Steve", "Stevie"}, {}},
		{"thomas", {"Thomas"}, {"Tom", "Tommy"}, {"Thom"}},
		{"timothy", {"Timothy"}, {"Tim", "Timmy"}, {}},
		{"victoria", {"Victoria"}, {"Vicky", "Tori"}, {"Vic"}},
		{"william", {"William"}, {"Will", "Bill", "Billy", "Willie", "Liam"}, {"Willy"}},
};

auto soundex_digit(char c) -> char
{
	switch (c) {
	case 'b':
	case 'f':
	case 'p':
	case 'v':
		return '1';
	case 'c':
	case 'g':
	case 'j':
	case 'k':
	case 'q':
	case 's':
	case 'x':
	case 'z':
		return '2';
	case 'd':
	case 't':
		return '3';
	case 'l':
		return '4';
	case 'm':
	case 'n':
		return '5';
	case 'r':
		return '6';
	default:
		return '0';
	}
}

auto split_words(std::string_view s) -> std::vector<std::string_view>
{
	std::vector<std::string_view> words;
	std::size_t i = 0;
	while (i < s.size()) {
		while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
			++i;
		const std::size_t start = i;
		while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
			++i;
		if (i > start)
			words.push_back(s.substr(start, i - start));
	}
	return words;
}

auto strip_spaces(std::string_view s) -> std::string
{
	std::string out;
	out.reserve(s.size());
	for (char c : s) {
		if (!std::isspace(static_cast<unsigned char>(c)))
			out.push_back(c);
	}
	return out;
}

auto percent(double similarity) -> int { return static_cast<int>(std::lround(similarity * 100.0)); }

} // namespace

namespace teamforge {

namespace m = constants::matching;

auto to_string(match_confidence c) -> std::string_view
{
	switch (c) {
	case match_confidence::exact:
		return "exact";
	case match_confidence::high:
		return "high";
	case match_confidence::medium:
		return "medium";
	case match_confidence::low:
		break;
	}
	return "low";
}

auto to_string(resolution_status s) -> std::string_view
{
	switch (s) {
	case resolution_status::accepted:
		return "accepted";
	case resolution_status::needs_review:
		return "needs-review";
	case resolution_status::suggestion:
		return "suggestion";
	case resolution_status::not_found:
		break;
	}
	return "not-found";
}

auto levenshtein_distance(std::string_view a, std::string_view b) -> std::size_t
{
	// two-row DP over b
	std::vector<std::size_t> prev(b.size() + 1);
	std::vector<std::size_t> cur(b.size() + 1);
	std::iota(prev.begin(), prev.end(), std::size_t{0});

	for (std::size_t i = 1; i <= a.size(); ++i) {
		cur[0] = i;
		for (std::size_t j = 1; j <= b.size(); ++j) {
			const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
			cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
		}
		std::swap(prev, cur);
	}
	return prev[b.size()];
}

auto levenshtein_similarity(std::string_view a, std::string_view b) -> double
{
	const auto max_len = std::max(a.size(), b.size());
	if (max_len == 0)
		return 1.0;
	const auto distance = levenshtein_distance(util::to_lower(a), util::to_lower(b));
	return 1.0 - static_cast<double>(distance) / static_cast<double>(max_len);
}

auto soundex(std::string_view name) -> std::string
{
	const auto lowered = util::to_lower(name);
	if (lowered.empty())
		return {};

	std::string digits;
	char last = '\0';
	for (std::size_t i = 1; i < lowered.size(); ++i) {
		const char d = soundex_digit(lowered[i]);
		// collapse adjacent repeats before vowels/separators are dropped
		if (d != last && d != '0' && digits.size() < 3)
			digits.push_back(d);
		last = d;
	}

	std::string out{lowered.front()};
	out += digits;
	out.resize(4, '0');
	return out;
}

name_resolver::name_resolver(log_sink log) : log_(std::move(log)) { build_nickname_map(); }

auto name_resolver::build_nickname_map() -> void
{
	for (const auto &entry : nickname_table) {
		std::vector<std::string> all;
		for (const auto *list : {&entry.formal, &entry.nicknames, &entry.diminutives})
			for (auto v : *list)
				all.push_back(util::to_lower(v));

		for (const auto &variant : all) {
			auto &related = nicknames_[variant];
			related.emplace_back(entry.base);
			for (const auto &other : all) {
				if (other != variant)
					related.push_back(other);
			}
		}
	}
}

auto name_resolver::variants_of(const std::string &lowered) const -> std::span<const std::string>
{
	if (auto it = nicknames_.find(lowered); it != nicknames_.end())
		return it->second;
	return {};
}

auto name_resolver::check_concatenated(std::string_view input, std::string_view candidate) const -> std::optional<match_result>
{
	const auto candidate_joined = strip_spaces(candidate);
	if (input == candidate_joined)
		return match_result{.score = m::concatenated_score,
												.confidence = match_confidence::high,
												.reason = std::format("Concatenated name match: \"{}\" -> \"{}\"", input, candidate)};

	const auto words = split_words(candidate);
	if (words.size() != 2)
		return std::nullopt;

	const std::string first{words[0]};
	const std::string last{words[1]};

	std::vector<std::string> patterns{first + last, first + last.front(), first.front() + last};
	const auto variants = variants_of(first);
	for (const auto &v : variants) {
		patterns.push_back(v + last);
		patterns.push_back(v + last.front());
	}

	if (std::ranges::find(patterns, input) != patterns.end())
		return match_result{.score = m::concatenation_pattern_score,
												.confidence = match_confidence::high,
												.reason = std::format("Name concatenation match: \"{}\" -> \"{}\"", input, candidate)};

	const double similarity = levenshtein_similarity(input, candidate_joined);
	if (similarity >= m::high_similarity)
		return match_result{.score = similarity * m::concatenated_score,
												.confidence = match_confidence::high,
												.reason = std::format("Fuzzy concatenation match: \"{}\" -> \"{}\" ({}%)", input, candidate, percent(similarity))};

	return std::nullopt;
}

auto name_resolver::check_nickname(std::string_view input, std::string_view candidate) const -> std::optional<match_result>
{
	const auto related = [this](const std::string &a, const std::string &b) {
		const auto va = variants_of(a);
		const auto vb = variants_of(b);
		return std::ranges::any_of(va, [&](const std::string &v) { return v == b || std::ranges::find(vb, v) != vb.end(); });
	};

	const std::string in{input};
	const std::string cand{candidate};
	if (related(in, cand))
		return match_result{.score = m::nickname_score, .confidence = match_confidence::high, .reason = std::format("Nickname match: {} <-> {}", input, candidate)};

	// "Mike Smith" vs "Michael Smith": same surname, related first names
	const auto iw = split_words(input);
	const auto cw = split_words(candidate);
	if (iw.size() == 2 && cw.size() == 2 && iw[1] == cw[1] && related(std::string{iw[0]}, std::string{cw[0]}))
		return match_result{.score = m::nickname_score, .confidence = match_confidence::high, .reason = std::format("Nickname variant: {} -> {}", input, candidate)};

	return std::nullopt;
}

auto name_resolver::check_similarity(std::string_view input, std::string_view candidate) -> std::optional<match_result>
{
	const double similarity = levenshtein_similarity(input, candidate);
	if (similarity >= m::high_similarity)
		return match_result{.score = similarity, .confidence = match_confidence::high, .reason = std::format("High similarity ({}%)", percent(similarity))};
	if (similarity >= m::medium_similarity)
		return match_result{.score = similarity, .confidence = match_confidence::medium, .reason = std::format("Moderate similarity ({}%)", percent(similarity))};
	return std::nullopt;
}

auto name_resolver::check_partial(std::string_view input, std::string_view candidate) -> std::optional<match_result>
{
	if (input.empty() || candidate.empty())
		return std::nullopt;
	if (!candidate.contains(input) && !input.contains(candidate))
		return std::nullopt;

	const double ratio = static_cast<double>(std::min(input.size(), candidate.size())) / static_cast<double>(std::max(input.size(), candidate.size()));
	if (ratio < m::partial_min_ratio)
		return std::nullopt;
	return match_result{.score = ratio * m::partial_weight, .confidence = match_confidence::medium, .reason = "Partial name match"};
}

auto name_resolver::match_single(std::string_view input, std::string_view candidate) const -> match_result
{
	if (util::trim(input) == util::trim(candidate))
		return {.match = std::string{candidate}, .score = m::exact_score, .confidence = match_confidence::exact, .reason = "Exact match"};

	const auto in = util::normalize(input);
	const auto cand = util::normalize(candidate);
	if (in == cand)
		return {.match = std::string{candidate}, .score = m::case_insensitive_score, .confidence = match_confidence::exact, .reason = "Case-insensitive exact match"};

	std::optional<match_result> best;
	const auto consider = [&best](std::optional<match_result> r) {
		if (r && (!best || r->score > best->score + m::material_gain))
			best = std::move(r);
	};

	consider(check_concatenated(in, cand));
	consider(check_nickname(in, cand));

	const auto sx_in = soundex(in);
	if (!sx_in.empty() && sx_in == soundex(cand))
		consider(match_result{.score = m::phonetic_score, .confidence = match_confidence::medium, .reason = "Phonetic similarity"});

	consider(check_similarity(in, cand));
	consider(check_partial(in, cand));

	if (!best)
		return {.match = std::string{candidate}, .score = 0.0, .confidence = match_confidence::low, .reason = "No significant similarity found"};

	best->match = std::string{candidate};
	return *best;
}

auto name_resolver::match(std::string_view input, std::span<const std::string> candidates, double threshold) -> std::vector<match_result>
{
	std::string key{input};
	key += '\x1f';
	for (const auto &c : candidates) {
		key += c;
		key += '\x1e';
	}
	key += std::format("\x1f{}", threshold);

	if (auto it = cache_.find(key); it != cache_.end())
		return it->second;

	std::vector<match_result> results;
	for (const auto &c : candidates) {
		auto r = match_single(input, c);
		if (r.score >= threshold)
			results.push_back(std::move(r));
	}
	std::ranges::stable_sort(results, std::greater{}, &match_result::score);

	cache_.emplace(std::move(key), results);
	return results;
}

auto name_resolver::resolve(std::string_view input, std::span<const std::string> candidates, double threshold) -> resolution
{
	const auto index_of = [&](const match_result &r) -> std::optional<std::size_t> {
		auto it = std::ranges::find(candidates, r.match);
		if (it == candidates.end())
			return std::nullopt;
		return static_cast<std::size_t>(std::distance(candidates.begin(), it));
	};

	auto ranked = match(input, candidates, threshold);
	if (!ranked.empty()) {
		auto best = std::move(ranked.front());
		resolution out{.match = best, .candidate_index = index_of(best)};

		switch (best.confidence) {
		case match_confidence::exact:
		case match_confidence::high:
			out.status = resolution_status::accepted;
			if (best.score < m::exact_score)
				log(log_, log_level::info, "Matched \"{}\" to \"{}\" ({})", input, best.match, best.reason);
			break;
		case match_confidence::medium:
			out.status = resolution_status::needs_review;
			log(log_, log_level::warning, "Matched \"{}\" to \"{}\" ({}), please verify", input, best.match, best.reason);
			break;
		case match_confidence::low:
			out.status = resolution_status::suggestion;
			break;
		}
		return out;
	}

	if (threshold > m::suggestion_threshold) {
		auto loose = match(input, candidates, m::suggestion_threshold);
		if (!loose.empty()) {
			log(log_, log_level::info, "\"{}\" not matched; closest is \"{}\" ({})", input, loose.front().match, loose.front().reason);
			return {.status = resolution_status::suggestion, .match = loose.front(), .candidate_index = index_of(loose.front())};
		}
	}

	log(log_, log_level::warning, "\"{}\" not found in roster", input);
	return {};
}

auto name_resolver::is_likely_match(std::string_view a, std::string_view b, double threshold) const -> bool { return match_single(a, b).score >= threshold; }

auto name_resolver::suggestions(std::string_view partial, std::span<const std::string> candidates, std::size_t limit) -> std::vector<match_result>
{
	auto out = match(partial, candidates, m::suggestion_threshold);
	if (out.size() > limit)
		out.resize(limit);
	return out;
}

auto name_resolver::add_custom_mapping(std::string_view base_name, std::span<const std::string> variants) -> void
{
	const auto base = util::normalize(base_name);
	for (const auto &v : variants) {
		const auto lowered = util::normalize(v);
		nicknames_[lowered].push_back(base);
		nicknames_[base].push_back(lowered);
	}
	// cached rankings may now be stale
	cache_.clear();
}

auto name_resolver::clear_cache() -> void { cache_.clear(); }

} // namespace teamforge
