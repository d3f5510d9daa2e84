/* overlap_resolver.cpp - overlap resolution into a non-overlapping edit plan.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "overlap_resolver.hpp"
#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {
struct run_key {
	size_t paragraph_index;
	size_t run_index;

	auto operator<=>(const run_key&) const = default;
};

struct candidate {
	size_t finding_index;
	size_t start;
	size_t end;
	double confidence;
};

struct piece {
	size_t finding_index;
	size_t start;
	size_t end;
	double confidence;
};
} // namespace

agent_priority::agent_priority() : tiers{
	{"tech", agent_tier::rule},
	{"grammar", agent_tier::fast},
	{"stats", agent_tier::deep},
	{"subject", agent_tier::deep},
	{"chairman", agent_tier::synthesis},
} {
}

agent_priority::agent_priority(std::map<std::string, agent_tier> agent_tiers) : tiers{std::move(agent_tiers)} {
}

agent_tier agent_priority::tier_of(const std::string& agent_id) const {
	const auto it = tiers.find(agent_id);
	return it == tiers.end() ? agent_tier::unknown : it->second;
}

std::optional<agent_tier> agent_tier_from_string(std::string_view value) noexcept {
	if (value == "rule") {
		return agent_tier::rule;
	}
	if (value == "fast") {
		return agent_tier::fast;
	}
	if (value == "deep") {
		return agent_tier::deep;
	}
	if (value == "synthesis") {
		return agent_tier::synthesis;
	}
	if (value == "unknown") {
		return agent_tier::unknown;
	}
	return std::nullopt;
}

overlap_resolver::overlap_resolver(agent_priority priority) : priorities{std::move(priority)} {
}

edit_plan overlap_resolver::resolve(const std::vector<finding>& findings, const std::vector<locate_result>& results) const {
	edit_plan plan;
	const size_t count = std::min(findings.size(), results.size());
	std::map<run_key, std::vector<candidate>> by_run;
	for (size_t i = 0; i < count; ++i) {
		if (!results[i].found()) {
			continue;
		}
		for (const auto& span : results[i].spans) {
			if (span.length == 0) {
				continue;
			}
			by_run[{span.paragraph_index, span.run_index}].push_back({i, span.start, span.end(), span.confidence});
		}
	}
	const auto beats = [&](const candidate& a, const candidate& b) {
		const auto& fa = findings[a.finding_index];
		const auto& fb = findings[b.finding_index];
		if (fa.level != fb.level) {
			return fa.level == severity::major;
		}
		if (a.confidence != b.confidence) {
			return a.confidence > b.confidence;
		}
		const int ra = priorities.rank(fa.agent_id);
		const int rb = priorities.rank(fb.agent_id);
		if (ra != rb) {
			return ra < rb;
		}
		return a.finding_index < b.finding_index;
	};
	for (const auto& [key, candidates] : by_run) {
		std::vector<size_t> bounds;
		bounds.reserve(candidates.size() * 2);
		for (const auto& c : candidates) {
			bounds.push_back(c.start);
			bounds.push_back(c.end);
		}
		std::ranges::sort(bounds);
		bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());
		std::vector<piece> pieces;
		for (size_t b = 0; b + 1 < bounds.size(); ++b) {
			const size_t lo = bounds[b];
			const size_t hi = bounds[b + 1];
			const candidate* winner = nullptr;
			for (const auto& c : candidates) {
				if (c.start <= lo && c.end >= hi && (winner == nullptr || beats(c, *winner))) {
					winner = &c;
				}
			}
			if (winner == nullptr) {
				continue;
			}
			for (const auto& c : candidates) {
				if (&c == winner || c.start > lo || c.end < hi || c.finding_index == winner->finding_index) {
					continue;
				}
				auto& conflicts = plan.conflicts;
				if (!conflicts.empty()) {
					auto& last = conflicts.back();
					if (last.winner == winner->finding_index && last.loser == c.finding_index && last.paragraph_index == key.paragraph_index && last.run_index == key.run_index && last.start + last.length == lo) {
						last.length += hi - lo;
						continue;
					}
				}
				conflicts.push_back({winner->finding_index, c.finding_index, key.paragraph_index, key.run_index, lo, hi - lo});
			}
			if (!pieces.empty() && pieces.back().finding_index == winner->finding_index && pieces.back().end == lo) {
				pieces.back().end = hi;
				continue;
			}
			pieces.push_back({winner->finding_index, lo, hi, winner->confidence});
		}
		for (const auto& p : pieces) {
			const auto& f = findings[p.finding_index];
			edit_entry entry;
			entry.span = {key.paragraph_index, key.run_index, p.start, p.end - p.start, p.confidence};
			entry.finding_index = p.finding_index;
			entry.level = f.level;
			entry.agent_id = f.agent_id;
			entry.note = f.note;
			plan.entries.push_back(std::move(entry));
		}
	}
	// One comment group per finding, numbered by first appearance in document order.
	std::map<size_t, size_t> groups;
	for (auto& entry : plan.entries) {
		const auto [it, inserted] = groups.try_emplace(entry.finding_index, groups.size());
		entry.comment_group = it->second;
	}
	plan.group_count = groups.size();
	if (!plan.conflicts.empty()) {
		spdlog::debug("Resolved {} overlapping ranges", plan.conflicts.size());
	}
	return plan;
}
