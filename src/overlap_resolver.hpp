/* overlap_resolver.hpp - header file for the overlap resolver.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "finding.hpp"
#include "span_locator.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Earlier tiers win exact ties.
enum class agent_tier {
	rule = 0,
	fast,
	deep,
	synthesis,
	unknown
};

class agent_priority {
public:
	agent_priority();
	explicit agent_priority(std::map<std::string, agent_tier> agent_tiers);

	[[nodiscard]] agent_tier tier_of(const std::string& agent_id) const;

	[[nodiscard]] int rank(const std::string& agent_id) const {
		return static_cast<int>(tier_of(agent_id));
	}

	[[nodiscard]] const std::map<std::string, agent_tier>& entries() const noexcept {
		return tiers;
	}

private:
	std::map<std::string, agent_tier> tiers;
};

[[nodiscard]] std::optional<agent_tier> agent_tier_from_string(std::string_view value) noexcept;

struct edit_entry {
	resolved_span span;
	size_t finding_index{0};
	size_t comment_group{0};
	severity level{severity::minor};
	std::string agent_id;
	std::string note;
};

struct overlap_conflict {
	size_t winner{0};
	size_t loser{0};
	size_t paragraph_index{0};
	size_t run_index{0};
	size_t start{0};
	size_t length{0};
};

struct edit_plan {
	std::vector<edit_entry> entries;
	std::vector<overlap_conflict> conflicts;
	size_t group_count{0};

	[[nodiscard]] bool empty() const noexcept {
		return entries.empty();
	}
};

class overlap_resolver {
public:
	explicit overlap_resolver(agent_priority priority = {});

	// results[i] holds the located spans of findings[i].
	[[nodiscard]] edit_plan resolve(const std::vector<finding>& findings, const std::vector<locate_result>& results) const;

private:
	agent_priority priorities;
};
