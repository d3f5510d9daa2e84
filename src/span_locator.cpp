/* span_locator.cpp - span locator: exact, normalized and fuzzy matching.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "span_locator.hpp"
#include "constants.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <cwctype>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
constexpr double EXACT_CONFIDENCE = 1.0;
constexpr double NORMALIZED_CONFIDENCE = 0.9;
constexpr double FUZZY_MIN_CONFIDENCE = 0.6;
constexpr double FUZZY_CONFIDENCE_RANGE = 0.25;
// Upper bound on alignment cells for one fuzzy search.
constexpr size_t FUZZY_MAX_CELLS = 64 * 1024 * 1024;

bool is_matching_space(wchar_t c) {
	switch (c) {
		case L' ':
		case L'\t':
		case L'\n':
		case L'\r':
		case L'\f':
		case L'\v':
		case 0x00A0:
		case 0x1680:
		case 0x202F:
		case 0x205F:
		case 0x3000:
			return true;
		default:
			return c >= 0x2000 && c <= 0x200A;
	}
}

wchar_t fold_punctuation(wchar_t c) {
	switch (c) {
		case 0x2018:
		case 0x2019:
		case 0x201A:
		case 0x201B:
		case 0x2032:
			return L'\'';
		case 0x201C:
		case 0x201D:
		case 0x201E:
		case 0x201F:
		case 0x2033:
			return L'"';
		case 0x2010:
		case 0x2011:
		case 0x2012:
		case 0x2013:
		case 0x2014:
		case 0x2015:
		case 0x2212:
			return L'-';
		default:
			return c;
	}
}

bool is_invisible(wchar_t c) {
	return c == 0x00AD || c == 0x200B || c == 0x200C || c == 0x200D || c == 0xFEFF;
}

size_t distance_to(size_t position, std::optional<size_t> target) {
	if (!target) {
		return 0;
	}
	return position > *target ? position - *target : *target - position;
}

struct hint_target {
	std::optional<size_t> point;
	// Occurrences starting in [first, last) win over closer ones outside it.
	std::optional<size_t> first;
	std::optional<size_t> last;

	[[nodiscard]] std::pair<bool, size_t> rank(size_t position) const {
		const bool outside = first && (position < *first || position >= *last);
		return {outside, distance_to(position, point)};
	}
};

hint_target hint_position(const text_index& scope, const location_hint& hint) {
	hint_target target;
	if (hint.paragraph) {
		target.first = scope.map.paragraph_start(*hint.paragraph);
		target.last = scope.map.paragraph_end(*hint.paragraph);
		if (!target.first || !target.last) {
			target.first.reset();
			target.last.reset();
		}
		target.point = target.first;
	}
	if (hint.offset) {
		target.point = std::min(*hint.offset, scope.text.length());
	}
	return target;
}

std::wstring trimmed_pattern(const normalized_text& text) {
	size_t first{0};
	size_t last{text.text.size()};
	while (first < last && text.text[first] == L' ') {
		++first;
	}
	while (last > first && text.text[last - 1] == L' ') {
		--last;
	}
	return text.text.substr(first, last - first);
}

struct fuzzy_match {
	size_t start{0};
	size_t end{0};
	double score{-1.0};
};

// Semi-global edit distance: the pattern must be consumed entirely, the text window is free.
fuzzy_match approximate_search(std::wstring_view text, std::wstring_view pattern, std::optional<size_t> target) {
	const size_t m = pattern.size();
	const size_t n = text.size();
	fuzzy_match best;
	if (m == 0 || n == 0) {
		return best;
	}
	std::vector<size_t> dist(m + 1);
	std::vector<size_t> start(m + 1, 0);
	std::vector<size_t> next_dist(m + 1);
	std::vector<size_t> next_start(m + 1);
	for (size_t i = 0; i <= m; ++i) {
		dist[i] = i;
	}
	size_t best_distance_to_target{0};
	for (size_t j = 1; j <= n; ++j) {
		next_dist[0] = 0;
		next_start[0] = j;
		const wchar_t tc = static_cast<wchar_t>(std::towlower(static_cast<wint_t>(text[j - 1])));
		for (size_t i = 1; i <= m; ++i) {
			const wchar_t pc = static_cast<wchar_t>(std::towlower(static_cast<wint_t>(pattern[i - 1])));
			size_t cost = dist[i - 1] + (pc == tc ? 0 : 1);
			size_t origin = start[i - 1];
			if (dist[i] + 1 < cost) {
				cost = dist[i] + 1;
				origin = start[i];
			}
			if (next_dist[i - 1] + 1 < cost) {
				cost = next_dist[i - 1] + 1;
				origin = next_start[i - 1];
			}
			next_dist[i] = cost;
			next_start[i] = origin;
		}
		const size_t window = j - next_start[m];
		const double score = 1.0 - static_cast<double>(next_dist[m]) / static_cast<double>(std::max(m, window));
		const size_t closeness = distance_to(next_start[m], target);
		if (score > best.score + 1e-9 || (score > best.score - 1e-9 && closeness < best_distance_to_target)) {
			best = {next_start[m], j, score};
			best_distance_to_target = closeness;
		}
		std::swap(dist, next_dist);
		std::swap(start, next_start);
	}
	return best;
}
} // namespace

normalized_text normalize_for_matching(std::wstring_view input) {
	normalized_text out;
	out.text.reserve(input.size());
	out.origin.reserve(input.size());
	for (size_t i = 0; i < input.size(); ++i) {
		const wchar_t c = input[i];
		if (is_matching_space(c)) {
			if (!out.text.empty() && out.text.back() == L' ') {
				continue;
			}
			out.text.push_back(L' ');
			out.origin.push_back(i);
		} else if (is_invisible(c)) {
			continue;
		} else if (c == 0x2026) {
			for (int k = 0; k < 3; ++k) {
				out.text.push_back(L'.');
				out.origin.push_back(i);
			}
		} else {
			out.text.push_back(fold_punctuation(c));
			out.origin.push_back(i);
		}
	}
	return out;
}

span_locator::span_locator(const document& source, const text_index& whole_index, const std::vector<chapter>& doc_chapters, locator_options opts) : doc{source}, whole{whole_index}, chapters{doc_chapters}, options{opts} {
	ensure_current(whole);
	for (const auto& ch : chapters) {
		ensure_current(ch.index);
	}
}

void span_locator::ensure_current(const text_index& index) const {
	if (index.map.built_for() != doc.generation()) {
		throw review_exception(_("Text index is stale; rebuild it after injecting edits"), review_error_code::stale_index);
	}
}

locate_result span_locator::locate(const finding& f) const {
	locate_result result;
	const wxString literal = wxString::FromUTF8(trim_string(f.literal_text));
	if (literal.length() < MIN_LITERAL_LENGTH) {
		result.status = locate_status::too_short;
		return result;
	}
	const text_index* scope = &whole;
	if (f.hint.chapter_id) {
		const auto it = std::ranges::find_if(chapters, [&](const chapter& ch) {
			return ch.id == *f.hint.chapter_id;
		});
		if (it == chapters.end()) {
			result.status = locate_status::unknown_chapter;
			return result;
		}
		scope = &it->index;
	}
	ensure_current(*scope);
	const auto target = hint_position(*scope, f.hint);
	const offset_map& map = scope->map;

	// Exact, case-sensitive.
	std::optional<size_t> exact;
	long pos = find_text(scope->text, literal, 0, find_options::forward | find_options::match_case);
	while (pos != wxNOT_FOUND) {
		const auto found = static_cast<size_t>(pos);
		if (map.within_paragraph(found, found + literal.length())) {
			if (!exact || target.rank(found) < target.rank(*exact)) {
				exact = found;
			}
			if (!target.point) {
				break;
			}
		}
		pos = find_text(scope->text, literal, pos + 1, find_options::forward | find_options::match_case);
	}
	if (exact) {
		result.spans = to_spans(*scope, *exact, *exact + literal.length(), EXACT_CONFIDENCE);
		if (!result.spans.empty()) {
			result.status = locate_status::found;
			result.kind = match_kind::exact;
			result.score = 1.0;
			return result;
		}
	}

	const std::wstring haystack = scope->text.ToStdWstring();
	const normalized_text norm_haystack = normalize_for_matching(haystack);
	const std::wstring norm_literal = trimmed_pattern(normalize_for_matching(literal.ToStdWstring()));
	if (norm_literal.size() < MIN_LITERAL_LENGTH || norm_haystack.text.empty()) {
		return result;
	}

	// Sentinels fold into spaces here, so matches reaching into the next paragraph are dropped.
	std::optional<std::pair<size_t, size_t>> normalized;
	size_t npos = norm_haystack.text.find(norm_literal);
	while (npos != std::wstring::npos) {
		const size_t start = norm_haystack.origin[npos];
		const size_t end = norm_haystack.origin[npos + norm_literal.size() - 1] + 1;
		if (map.within_paragraph(start, end)) {
			if (!normalized || target.rank(start) < target.rank(normalized->first)) {
				normalized = std::make_pair(start, end);
			}
			if (!target.point) {
				break;
			}
		}
		npos = norm_haystack.text.find(norm_literal, npos + 1);
	}
	if (normalized) {
		result.spans = to_spans(*scope, normalized->first, normalized->second, NORMALIZED_CONFIDENCE);
		if (!result.spans.empty()) {
			result.status = locate_status::found;
			result.kind = match_kind::normalized;
			result.score = 1.0;
			return result;
		}
	}

	if (norm_literal.size() > options.fuzzy_max_literal) {
		spdlog::debug("Literal of {} characters exceeds the fuzzy limit", norm_literal.size());
		return result;
	}
	if (norm_literal.size() * norm_haystack.text.size() > FUZZY_MAX_CELLS) {
		spdlog::debug("Fuzzy search over {} characters skipped", norm_haystack.text.size());
		return result;
	}
	const std::wstring_view norm_text{norm_haystack.text};
	const auto& origin = norm_haystack.origin;
	std::optional<size_t> norm_target;
	if (target.point) {
		norm_target = static_cast<size_t>(std::ranges::lower_bound(origin, *target.point) - origin.begin());
	}
	// One alignment per paragraph keeps a fuzzy window from spanning a sentinel.
	fuzzy_match match;
	for (size_t p = scope->range.first; p < scope->range.end; ++p) {
		const auto para_start = map.paragraph_start(p);
		const auto para_end = map.paragraph_end(p);
		if (!para_start || !para_end || *para_end <= *para_start) {
			continue;
		}
		const auto first = static_cast<size_t>(std::ranges::lower_bound(origin, *para_start) - origin.begin());
		const auto last = static_cast<size_t>(std::ranges::lower_bound(origin, *para_end) - origin.begin());
		if (last <= first) {
			continue;
		}
		std::optional<size_t> local_target;
		if (norm_target) {
			local_target = *norm_target > first ? std::min(*norm_target - first, last - first) : 0;
		}
		auto candidate = approximate_search(norm_text.substr(first, last - first), norm_literal, local_target);
		if (candidate.end <= candidate.start) {
			continue;
		}
		candidate.start += first;
		candidate.end += first;
		const bool better = candidate.score > match.score + 1e-9 || (candidate.score > match.score - 1e-9 && target.rank(origin[candidate.start]) < target.rank(origin[match.start]));
		if (better) {
			match = candidate;
		}
	}
	result.score = std::max(match.score, 0.0);
	if (match.score < options.fuzzy_threshold || match.end <= match.start) {
		return result;
	}
	size_t start = origin[match.start];
	size_t end = origin[match.end - 1] + 1;
	while (start < end && is_matching_space(haystack[start])) {
		++start;
	}
	while (end > start && is_matching_space(haystack[end - 1])) {
		--end;
	}
	const double span = 1.0 - options.fuzzy_threshold;
	const double confidence = span > 0.0 ? FUZZY_MIN_CONFIDENCE + FUZZY_CONFIDENCE_RANGE * (match.score - options.fuzzy_threshold) / span : FUZZY_MIN_CONFIDENCE + FUZZY_CONFIDENCE_RANGE;
	result.spans = to_spans(*scope, start, end, confidence);
	if (!result.spans.empty()) {
		result.status = locate_status::found;
		result.kind = match_kind::fuzzy;
	}
	return result;
}

std::vector<resolved_span> span_locator::to_spans(const text_index& scope, size_t start, size_t end, double confidence) const {
	std::vector<resolved_span> spans;
	for (const auto& slice : scope.map.slices(start, end)) {
		spans.push_back({slice.paragraph_index, slice.run_index, slice.start, slice.length, confidence});
	}
	return spans;
}

const char* match_kind_name(match_kind kind) noexcept {
	switch (kind) {
		case match_kind::exact:
			return "exact";
		case match_kind::normalized:
			return "normalized";
		case match_kind::fuzzy:
			return "fuzzy";
		default:
			return "none";
	}
}
