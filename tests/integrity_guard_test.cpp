/* integrity_guard_test.cpp - tests for package verification and round-trip checks.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "docx_fixture.hpp"
#include "docx_loader.hpp"
#include "integrity_guard.hpp"
#include "overlap_resolver.hpp"
#include "package.hpp"
#include "review_error.hpp"
#include "run_injector.hpp"
#include <gtest/gtest.h>
#include <string>
#include <wx/string.h>

namespace {
std::string highlighted_copy(const std::string& bytes) {
	auto doc = docx_loader::load(bytes);
	edit_plan plan;
	edit_entry entry;
	entry.span = {0, 0, 2, 3, 1.0};
	entry.level = severity::major;
	entry.note = "check this";
	plan.entries.push_back(entry);
	plan.group_count = 1;
	(void)run_injector().apply(*doc, plan);
	return doc->to_bytes();
}
} // namespace

TEST(integrity_guard_test, valid_package_passes) {
	const integrity_guard guard;
	wxString reason;
	EXPECT_TRUE(guard.verify(make_docx(plain_paragraph("hello")), &reason));
	EXPECT_TRUE(reason.IsEmpty());
}

TEST(integrity_guard_test, rejects_broken_content_types) {
	package pkg = package::from_bytes(make_docx(plain_paragraph("hello")));
	pkg.set_part("[Content_Types].xml", "<Other/>");
	wxString reason;
	EXPECT_FALSE(integrity_guard().verify(pkg.to_bytes(), &reason));
	EXPECT_FALSE(reason.IsEmpty());
	pkg.set_part("[Content_Types].xml", "<Types");
	EXPECT_FALSE(integrity_guard().verify(pkg.to_bytes()));
}

TEST(integrity_guard_test, rejects_non_zip_and_bodyless_documents) {
	const integrity_guard guard;
	EXPECT_FALSE(guard.verify("plain text, not a package"));
	EXPECT_FALSE(guard.verify(""));
	package pkg = package::from_bytes(make_docx(plain_paragraph("hello")));
	pkg.set_part("word/document.xml", R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"/>)");
	EXPECT_FALSE(guard.verify(pkg.to_bytes()));
}

TEST(integrity_guard_test, enforces_size_limit) {
	const std::string bytes = make_docx(plain_paragraph("hello"));
	EXPECT_FALSE(integrity_guard(bytes.size() - 1).verify(bytes));
	EXPECT_TRUE(integrity_guard(bytes.size()).verify(bytes));
}

TEST(integrity_guard_test, roundtrip_accepts_highlighted_copy) {
	const std::string before = make_docx(paragraph_xml({{"abcdefgh", "<w:b/>"}, {" tail", ""}}) + plain_paragraph("second"));
	const std::string after = highlighted_copy(before);
	EXPECT_NO_THROW(integrity_guard::verify_roundtrip(before, after));
	EXPECT_TRUE(integrity_guard().verify(after));
}

TEST(integrity_guard_test, roundtrip_rejects_changed_text) {
	const std::string before = make_docx(plain_paragraph("original words"));
	const std::string after = make_docx(plain_paragraph("original wordz"));
	EXPECT_THROW(integrity_guard::verify_roundtrip(before, after), roundtrip_invariant_violation);
}

TEST(integrity_guard_test, roundtrip_rejects_lost_paragraph_and_formatting) {
	const std::string before = make_docx(plain_paragraph("one") + plain_paragraph("two"));
	EXPECT_THROW(integrity_guard::verify_roundtrip(before, make_docx(plain_paragraph("onetwo"))), roundtrip_invariant_violation);
	const std::string bold = make_docx(paragraph_xml({{"styled", "<w:b/>"}}));
	const std::string italic = make_docx(paragraph_xml({{"styled", "<w:i/>"}}));
	EXPECT_THROW(integrity_guard::verify_roundtrip(bold, italic), roundtrip_invariant_violation);
}

TEST(integrity_guard_test, roundtrip_rejects_merged_runs) {
	const std::string before = make_docx(paragraph_xml({{"ab", ""}, {"cd", ""}}));
	const std::string after = make_docx(plain_paragraph("abcd"));
	EXPECT_THROW(integrity_guard::verify_roundtrip(before, after), roundtrip_invariant_violation);
}
