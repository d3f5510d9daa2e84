/* run_injector_test.cpp - tests for run splitting and annotation.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "docx_fixture.hpp"
#include "docx_loader.hpp"
#include "overlap_resolver.hpp"
#include "review_error.hpp"
#include "run_injector.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace {
edit_entry make_entry(size_t paragraph_index, size_t run_index, size_t start, size_t length, severity level, size_t group, const std::string& note = {}) {
	edit_entry entry;
	entry.span = {paragraph_index, run_index, start, length, 1.0};
	entry.finding_index = group;
	entry.comment_group = group;
	entry.level = level;
	entry.agent_id = "grammar";
	entry.note = note;
	return entry;
}

injector_options without_comments() {
	injector_options options;
	options.add_comments = false;
	return options;
}
} // namespace

TEST(run_injector_test, splits_run_and_highlights_only_the_span) {
	auto doc = docx_loader::load(make_docx(paragraph_xml({{"The quick brown fox", "<w:b/>"}}) + plain_paragraph("Untouched")));
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 0, 4, 5, severity::major, 0, "Wrong animal speed"));
	plan.group_count = 1;
	const auto summary = run_injector().apply(*doc, plan);
	EXPECT_EQ(summary.runs_split, 1u);
	EXPECT_EQ(summary.fragments_highlighted, 1u);
	EXPECT_EQ(summary.comments_added, 1u);
	EXPECT_EQ(doc->generation(), 1u);

	const auto& runs = doc->paragraphs[0].runs;
	ASSERT_EQ(runs.size(), 4u);
	EXPECT_EQ(runs[0].text, "The ");
	EXPECT_EQ(runs[1].text, "quick");
	EXPECT_TRUE(runs[2].anchor);
	EXPECT_EQ(runs[3].text, " brown fox");
	EXPECT_TRUE(runs[0].highlight.empty());
	EXPECT_EQ(runs[1].highlight, "red");
	EXPECT_TRUE(runs[3].highlight.empty());
	EXPECT_EQ(runs[0].format_signature, runs[1].format_signature);
	EXPECT_EQ(runs[1].format_signature, runs[3].format_signature);
	EXPECT_EQ(doc->paragraphs[0].text(), "The quick brown fox");
	ASSERT_EQ(doc->paragraphs[1].runs.size(), 1u);
	EXPECT_TRUE(doc->paragraphs[1].runs[0].highlight.empty());
}

TEST(run_injector_test, several_spans_in_one_run) {
	auto doc = docx_loader::load(make_docx(plain_paragraph("alpha beta gamma")));
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 0, 0, 5, severity::minor, 0));
	plan.entries.push_back(make_entry(0, 0, 11, 5, severity::major, 1));
	plan.group_count = 2;
	const auto summary = run_injector(without_comments()).apply(*doc, plan);
	EXPECT_EQ(summary.fragments_highlighted, 2u);
	EXPECT_EQ(summary.comments_added, 0u);
	const auto& runs = doc->paragraphs[0].runs;
	ASSERT_EQ(runs.size(), 3u);
	EXPECT_EQ(runs[0].text, "alpha");
	EXPECT_EQ(runs[0].highlight, "yellow");
	EXPECT_EQ(runs[1].text, " beta ");
	EXPECT_TRUE(runs[1].highlight.empty());
	EXPECT_EQ(runs[2].text, "gamma");
	EXPECT_EQ(runs[2].highlight, "red");
	EXPECT_STREQ(runs[1].node.child("w:t").attribute("xml:space").as_string(), "preserve");
}

TEST(run_injector_test, whole_run_span_is_highlighted_in_place) {
	auto doc = docx_loader::load(make_docx(paragraph_xml({{"keep", ""}, {"mark", R"(<w:b/><w:u w:val="single"/>)"}})));
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 1, 0, 4, severity::major, 0));
	plan.group_count = 1;
	const auto summary = run_injector(without_comments()).apply(*doc, plan);
	EXPECT_EQ(summary.runs_split, 0u);
	const auto& runs = doc->paragraphs[0].runs;
	ASSERT_EQ(runs.size(), 2u);
	EXPECT_EQ(runs[1].highlight, "red");
	const auto rpr = runs[1].node.child("w:rPr");
	const auto highlight = rpr.child("w:highlight");
	ASSERT_TRUE(highlight);
	EXPECT_STREQ(highlight.previous_sibling().name(), "w:b");
	EXPECT_STREQ(highlight.next_sibling().name(), "w:u");
}

TEST(run_injector_test, tabs_are_split_by_visible_width) {
	auto doc = docx_loader::load(make_docx("<w:p><w:r><w:t>a</w:t><w:tab/><w:t>bc</w:t></w:r></w:p>"));
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 0, 2, 2, severity::minor, 0));
	plan.group_count = 1;
	(void)run_injector(without_comments()).apply(*doc, plan);
	const auto& runs = doc->paragraphs[0].runs;
	ASSERT_EQ(runs.size(), 2u);
	EXPECT_EQ(runs[0].text, "a\t");
	EXPECT_EQ(runs[1].text, "bc");
	EXPECT_EQ(runs[1].highlight, "yellow");
}

TEST(run_injector_test, comments_part_is_created_and_registered) {
	auto doc = docx_loader::load(make_docx(paragraph_xml({{"first ", ""}, {"second", "<w:i/>"}})));
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 0, 0, 6, severity::minor, 0, "Spans two runs"));
	plan.entries.push_back(make_entry(0, 1, 0, 6, severity::minor, 0, "Spans two runs"));
	plan.group_count = 1;
	const auto summary = run_injector().apply(*doc, plan);
	EXPECT_EQ(summary.comments_added, 1u);
	const std::string bytes = doc->to_bytes();
	const std::string comments = read_part(bytes, "word/comments.xml");
	EXPECT_EQ(count_occurrences(comments, "<w:comment "), 1u);
	EXPECT_NE(comments.find("[MINOR] Spans two runs"), std::string::npos);
	EXPECT_NE(comments.find("Marginalia"), std::string::npos);
	EXPECT_NE(read_part(bytes, "word/_rels/document.xml.rels").find("comments.xml"), std::string::npos);
	EXPECT_EQ(count_occurrences(read_part(bytes, "[Content_Types].xml"), "/word/comments.xml"), 1u);
	const std::string main = read_part(bytes, "word/document.xml");
	EXPECT_EQ(count_occurrences(main, "w:commentRangeStart"), 1u);
	EXPECT_EQ(count_occurrences(main, "w:commentRangeEnd"), 1u);
	EXPECT_EQ(count_occurrences(main, "w:commentReference"), 1u);
	EXPECT_LT(main.find("w:commentRangeStart"), main.find("first"));
	EXPECT_GT(main.find("w:commentRangeEnd"), main.find("second"));
}

TEST(run_injector_test, control_characters_are_dropped_from_comments) {
	auto doc = docx_loader::load(make_docx(plain_paragraph("Some sentence")));
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 0, 0, 4, severity::minor, 0, "Tab\tstays\v, vertical\x01 tab goes"));
	plan.group_count = 1;
	injector_options options;
	options.comment_author = "Desk\x1b";
	(void)run_injector(options).apply(*doc, plan);
	const std::string comments = read_part(doc->to_bytes(), "word/comments.xml");
	EXPECT_EQ(comments.find("&#"), std::string::npos);
	EXPECT_EQ(comments.find('\v'), std::string::npos);
	EXPECT_NE(comments.find("[MINOR] Tab\tstays, vertical tab goes"), std::string::npos);
	EXPECT_NE(comments.find("w:author=\"Desk\""), std::string::npos);
}

TEST(utils_test, strip_control_chars_keeps_tab_and_newlines) {
	std::string input{"a"};
	input += '\0';
	input += "b\v\tc\n\rd\x1f";
	EXPECT_EQ(strip_control_chars(input), "ab\tc\n\rd");
	EXPECT_EQ(strip_control_chars("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(run_injector_test, existing_comments_are_kept_and_ids_continue) {
	docx_fixture fixture;
	fixture.body = plain_paragraph("annotated text");
	fixture.comments = R"(<w:comments xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
		R"(<w:comment w:id="5" w:author="Editor"><w:p><w:r><w:t>older note</w:t></w:r></w:p></w:comment></w:comments>)";
	auto doc = docx_loader::load(fixture.build());
	edit_plan plan;
	plan.entries.push_back(make_entry(0, 0, 0, 9, severity::major, 0, "New note"));
	plan.group_count = 1;
	(void)run_injector().apply(*doc, plan);
	const std::string bytes = doc->to_bytes();
	const std::string comments = read_part(bytes, "word/comments.xml");
	EXPECT_EQ(count_occurrences(comments, "<w:comment "), 2u);
	EXPECT_NE(comments.find("older note"), std::string::npos);
	EXPECT_NE(comments.find("w:id=\"6\""), std::string::npos);
	EXPECT_EQ(count_occurrences(read_part(bytes, "word/_rels/document.xml.rels"), "comments.xml"), 1u);
	EXPECT_EQ(count_occurrences(read_part(bytes, "[Content_Types].xml"), "/word/comments.xml"), 1u);
}

TEST(run_injector_test, empty_plan_is_a_no_op) {
	auto doc = docx_loader::load(make_docx(plain_paragraph("nothing to do")));
	const auto summary = run_injector().apply(*doc, edit_plan{});
	EXPECT_EQ(summary.fragments_highlighted, 0u);
	EXPECT_EQ(doc->generation(), 0u);
	EXPECT_EQ(doc->paragraphs[0].runs.size(), 1u);
}

TEST(run_injector_test, invalid_plans_leave_document_untouched) {
	auto doc = docx_loader::load(make_docx(plain_paragraph("short text")));
	const run_injector injector;

	edit_plan overlapping;
	overlapping.entries.push_back(make_entry(0, 0, 0, 5, severity::minor, 0));
	overlapping.entries.push_back(make_entry(0, 0, 3, 4, severity::minor, 1));
	overlapping.group_count = 2;
	EXPECT_THROW((void)injector.apply(*doc, overlapping), review_exception);

	edit_plan past_end;
	past_end.entries.push_back(make_entry(0, 0, 6, 10, severity::minor, 0));
	past_end.group_count = 1;
	EXPECT_THROW((void)injector.apply(*doc, past_end), review_exception);

	edit_plan missing_run;
	missing_run.entries.push_back(make_entry(0, 3, 0, 1, severity::minor, 0));
	missing_run.group_count = 1;
	try {
		(void)injector.apply(*doc, missing_run);
		FAIL() << "expected invalid plan";
	} catch (const review_exception& e) {
		EXPECT_EQ(e.get_error_code(), review_error_code::invalid_plan);
	}

	EXPECT_EQ(doc->generation(), 0u);
	ASSERT_EQ(doc->paragraphs[0].runs.size(), 1u);
	EXPECT_TRUE(doc->paragraphs[0].runs[0].highlight.empty());
}
