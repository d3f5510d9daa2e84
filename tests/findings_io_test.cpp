/* findings_io_test.cpp - tests for findings and report JSON.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "findings_io.hpp"
#include "review_error.hpp"
#include "review_report.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using nlohmann::json;

TEST(findings_io_test, parses_bare_array) {
	const auto findings = parse_findings(R"([
		{"location": {"chapter": 2, "offset": "120", "text": "the data was"}, "severity": "Major", "agent": "grammar", "note": "Agreement"},
		{"text": "fallback literal", "severity": "low"}
	])");
	ASSERT_EQ(findings.size(), 2u);
	EXPECT_EQ(findings[0].hint.chapter_id.value_or(0), 2);
	EXPECT_EQ(findings[0].hint.offset.value_or(0), 120u);
	EXPECT_FALSE(findings[0].hint.paragraph.has_value());
	EXPECT_EQ(findings[0].literal_text, "the data was");
	EXPECT_EQ(findings[0].level, severity::major);
	EXPECT_EQ(findings[0].agent_id, "grammar");
	EXPECT_EQ(findings[0].note, "Agreement");
	EXPECT_EQ(findings[1].literal_text, "fallback literal");
	EXPECT_EQ(findings[1].level, severity::minor);
	EXPECT_TRUE(findings[1].agent_id.empty());
}

TEST(findings_io_test, accepts_wrapped_lists) {
	EXPECT_EQ(parse_findings(R"({"findings": [{"text": "abc"}]})").size(), 1u);
	EXPECT_EQ(parse_findings(R"({"issues": [{"text": "abc"}, {"text": "def"}]})").size(), 2u);
	EXPECT_TRUE(parse_findings("[]").empty());
}

TEST(findings_io_test, note_built_from_issue_and_suggestion) {
	const auto findings = parse_findings(R"([
		{"text": "abc", "issue": "Passive voice.", "suggestion": "Use active voice."},
		{"text": "def", "suggestion": "Only a suggestion."}
	])");
	ASSERT_EQ(findings.size(), 2u);
	EXPECT_EQ(findings[0].note, "Passive voice. Suggestion: Use active voice.");
	EXPECT_EQ(findings[1].note, "Only a suggestion.");
}

TEST(findings_io_test, severity_aliases) {
	EXPECT_EQ(severity_from_string("critical"), severity::major);
	EXPECT_EQ(severity_from_string("HIGH"), severity::major);
	EXPECT_EQ(severity_from_string("medium"), severity::minor);
	EXPECT_EQ(severity_from_string(""), severity::minor);
	EXPECT_STREQ(severity_name(severity::major), "major");
}

TEST(findings_io_test, malformed_input_is_rejected) {
	for (const char* input : {"not json", R"({"other": []})", "[1, 2]", "{\"findings\": 3}"}) {
		try {
			(void)parse_findings(input);
			ADD_FAILURE() << input;
		} catch (const review_exception& e) {
			EXPECT_EQ(e.get_error_code(), review_error_code::invalid_findings) << input;
		}
	}
}

TEST(findings_io_test, invalid_indices_are_dropped) {
	const auto findings = parse_findings(R"([{"location": {"chapter": -1, "offset": "12a", "paragraph": "9999999999999999999999"}, "text": "abc"}])");
	ASSERT_EQ(findings.size(), 1u);
	EXPECT_FALSE(findings[0].hint.chapter_id.has_value());
	EXPECT_FALSE(findings[0].hint.offset.has_value());
	EXPECT_FALSE(findings[0].hint.paragraph.has_value());
}

TEST(findings_io_test, findings_written_back_parse_the_same) {
	finding f;
	f.hint.paragraph = 3;
	f.literal_text = "margin";
	f.level = severity::major;
	f.agent_id = "tech";
	f.note = "Left margin is 1.2 in";
	const auto parsed = parse_findings(findings_to_json({f}));
	ASSERT_EQ(parsed.size(), 1u);
	EXPECT_EQ(parsed[0].hint.paragraph.value_or(0), 3u);
	EXPECT_EQ(parsed[0].literal_text, "margin");
	EXPECT_EQ(parsed[0].level, severity::major);
	EXPECT_EQ(parsed[0].note, f.note);
}

TEST(findings_io_test, report_json_lists_counters_and_entries) {
	review_report report;
	report.findings_received = 3;
	report.findings_located = 2;
	report.add(report_kind::span_not_found, 1, "no match");
	report.add(report_kind::overlap_conflict, 0, "overlap");
	const auto j = json::parse(report_to_json(report));
	EXPECT_EQ(j["findings_received"], 3);
	EXPECT_EQ(j["conflicts"], 1);
	EXPECT_EQ(j["cancelled"], false);
	ASSERT_EQ(j["entries"].size(), 2u);
	EXPECT_EQ(j["entries"][0]["kind"], report_kind_name(report_kind::span_not_found));
	EXPECT_EQ(j["entries"][0]["finding"], 1);
	EXPECT_EQ(j["entries"][1]["level"], "info");
}

TEST(findings_io_test, geometry_json_lists_deviations) {
	page_geometry geometry;
	geometry.margins = {1.2, 1.0, 1.0, 1.0};
	geometry.default_font = {"Times New Roman", 12.0};
	const auto checks = compare_geometry(geometry, review_profile{});
	const auto j = json::parse(geometry_to_json(geometry, checks));
	EXPECT_EQ(j["passed"], false);
	ASSERT_EQ(j["deviations"].size(), 1u);
	EXPECT_EQ(j["deviations"][0]["field"], "margin_left");
	EXPECT_FALSE(json::parse(geometry_to_json(geometry)).contains("deviations"));
}
