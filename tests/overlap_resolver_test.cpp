/* overlap_resolver_test.cpp - tests for overlap resolution.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "overlap_resolver.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
finding make_finding(severity level, const std::string& agent) {
	finding f;
	f.level = level;
	f.agent_id = agent;
	f.literal_text = "text";
	f.note = agent + " note";
	return f;
}

locate_result found_at(std::vector<resolved_span> spans) {
	locate_result result;
	result.status = locate_status::found;
	result.kind = match_kind::exact;
	result.spans = std::move(spans);
	return result;
}

resolved_span span(size_t run_index, size_t start, size_t length, double confidence = 1.0) {
	return {0, run_index, start, length, confidence};
}
} // namespace

TEST(overlap_resolver_test, major_beats_minor_on_full_overlap) {
	const std::vector<finding> findings{make_finding(severity::minor, "grammar"), make_finding(severity::major, "subject")};
	const std::vector<locate_result> results{found_at({span(0, 0, 10)}), found_at({span(0, 0, 10)})};
	const auto plan = overlap_resolver().resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 1u);
	EXPECT_EQ(plan.entries[0].finding_index, 1u);
	EXPECT_EQ(plan.entries[0].level, severity::major);
	ASSERT_EQ(plan.conflicts.size(), 1u);
	EXPECT_EQ(plan.conflicts[0].winner, 1u);
	EXPECT_EQ(plan.conflicts[0].loser, 0u);
	EXPECT_EQ(plan.conflicts[0].length, 10u);
}

TEST(overlap_resolver_test, loser_keeps_its_remainder) {
	const std::vector<finding> findings{make_finding(severity::minor, "grammar"), make_finding(severity::major, "tech")};
	const std::vector<locate_result> results{found_at({span(0, 0, 20)}), found_at({span(0, 5, 5)})};
	const auto plan = overlap_resolver().resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 3u);
	EXPECT_EQ(plan.entries[0].finding_index, 0u);
	EXPECT_EQ(plan.entries[0].span.start, 0u);
	EXPECT_EQ(plan.entries[0].span.length, 5u);
	EXPECT_EQ(plan.entries[1].finding_index, 1u);
	EXPECT_EQ(plan.entries[1].span.start, 5u);
	EXPECT_EQ(plan.entries[1].span.length, 5u);
	EXPECT_EQ(plan.entries[2].finding_index, 0u);
	EXPECT_EQ(plan.entries[2].span.start, 10u);
	EXPECT_EQ(plan.entries[2].span.length, 10u);
	EXPECT_EQ(plan.entries[0].comment_group, plan.entries[2].comment_group);
	EXPECT_NE(plan.entries[0].comment_group, plan.entries[1].comment_group);
	EXPECT_EQ(plan.group_count, 2u);
}

TEST(overlap_resolver_test, partial_overlap_splits_at_boundaries) {
	const std::vector<finding> findings{make_finding(severity::minor, "grammar"), make_finding(severity::major, "tech")};
	const std::vector<locate_result> results{found_at({span(0, 0, 10)}), found_at({span(0, 5, 10)})};
	const auto plan = overlap_resolver().resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 2u);
	EXPECT_EQ(plan.entries[0].span.end(), 5u);
	EXPECT_EQ(plan.entries[1].finding_index, 1u);
	EXPECT_EQ(plan.entries[1].span.start, 5u);
	EXPECT_EQ(plan.entries[1].span.length, 10u);
	ASSERT_EQ(plan.conflicts.size(), 1u);
	EXPECT_EQ(plan.conflicts[0].start, 5u);
	EXPECT_EQ(plan.conflicts[0].length, 5u);
}

TEST(overlap_resolver_test, ties_break_on_confidence_then_agent_then_order) {
	{
		const std::vector<finding> findings{make_finding(severity::minor, "tech"), make_finding(severity::minor, "chairman")};
		const std::vector<locate_result> results{found_at({span(0, 0, 4, 0.7)}), found_at({span(0, 0, 4, 1.0)})};
		const auto plan = overlap_resolver().resolve(findings, results);
		ASSERT_EQ(plan.entries.size(), 1u);
		EXPECT_EQ(plan.entries[0].finding_index, 1u);
	}
	{
		const std::vector<finding> findings{make_finding(severity::minor, "chairman"), make_finding(severity::minor, "tech")};
		const std::vector<locate_result> results{found_at({span(0, 0, 4)}), found_at({span(0, 0, 4)})};
		const auto plan = overlap_resolver().resolve(findings, results);
		ASSERT_EQ(plan.entries.size(), 1u);
		EXPECT_EQ(plan.entries[0].finding_index, 1u);
	}
	{
		const std::vector<finding> findings{make_finding(severity::minor, "someone"), make_finding(severity::minor, "chairman")};
		const std::vector<locate_result> results{found_at({span(0, 0, 4)}), found_at({span(0, 0, 4)})};
		const auto plan = overlap_resolver().resolve(findings, results);
		ASSERT_EQ(plan.entries.size(), 1u);
		EXPECT_EQ(plan.entries[0].finding_index, 1u);
	}
	{
		const std::vector<finding> findings{make_finding(severity::minor, "grammar"), make_finding(severity::minor, "grammar")};
		const std::vector<locate_result> results{found_at({span(0, 0, 4)}), found_at({span(0, 0, 4)})};
		const auto plan = overlap_resolver().resolve(findings, results);
		ASSERT_EQ(plan.entries.size(), 1u);
		EXPECT_EQ(plan.entries[0].finding_index, 0u);
	}
}

TEST(overlap_resolver_test, adjacent_spans_of_different_findings_stay_separate) {
	const std::vector<finding> findings{make_finding(severity::minor, "grammar"), make_finding(severity::minor, "grammar")};
	const std::vector<locate_result> results{found_at({span(0, 0, 5)}), found_at({span(0, 5, 5)})};
	const auto plan = overlap_resolver().resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 2u);
	EXPECT_TRUE(plan.conflicts.empty());
	EXPECT_NE(plan.entries[0].comment_group, plan.entries[1].comment_group);
}

TEST(overlap_resolver_test, spans_of_one_finding_share_a_comment_group) {
	const std::vector<finding> findings{make_finding(severity::major, "stats")};
	const std::vector<locate_result> results{found_at({span(1, 0, 8), span(2, 0, 8)})};
	const auto plan = overlap_resolver().resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 2u);
	EXPECT_EQ(plan.entries[0].span.run_index, 1u);
	EXPECT_EQ(plan.entries[1].span.run_index, 2u);
	EXPECT_EQ(plan.entries[0].comment_group, plan.entries[1].comment_group);
	EXPECT_EQ(plan.group_count, 1u);
	EXPECT_EQ(plan.entries[1].note, "stats note");
}

TEST(overlap_resolver_test, unlocated_findings_are_ignored) {
	const std::vector<finding> findings{make_finding(severity::major, "tech"), make_finding(severity::minor, "grammar")};
	locate_result missing;
	const std::vector<locate_result> results{missing, found_at({span(0, 2, 3)})};
	const auto plan = overlap_resolver().resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 1u);
	EXPECT_EQ(plan.entries[0].finding_index, 1u);
}

TEST(overlap_resolver_test, configured_tiers_override_defaults) {
	agent_priority priority({{"grammar", agent_tier::rule}, {"tech", agent_tier::synthesis}});
	const std::vector<finding> findings{make_finding(severity::minor, "tech"), make_finding(severity::minor, "grammar")};
	const std::vector<locate_result> results{found_at({span(0, 0, 4)}), found_at({span(0, 0, 4)})};
	const auto plan = overlap_resolver(priority).resolve(findings, results);
	ASSERT_EQ(plan.entries.size(), 1u);
	EXPECT_EQ(plan.entries[0].finding_index, 1u);
	EXPECT_EQ(agent_tier_from_string("deep"), agent_tier::deep);
	EXPECT_FALSE(agent_tier_from_string("bogus").has_value());
}
