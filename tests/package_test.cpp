/* package_test.cpp - tests for the zip container.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "constants.hpp"
#include "docx_fixture.hpp"
#include "package.hpp"
#include "review_error.hpp"
#include <gtest/gtest.h>
#include <string>

TEST(package_test, rejects_empty_input) {
	EXPECT_THROW((void)package::from_bytes(""), corrupt_package_error);
}

TEST(package_test, rejects_bytes_that_are_not_a_zip) {
	EXPECT_THROW((void)package::from_bytes("this is a plain text file and not an archive"), corrupt_package_error);
}

TEST(package_test, unmodified_package_round_trips_byte_for_byte) {
	const std::string bytes = make_docx(plain_paragraph("Hello"));
	const package pkg = package::from_bytes(bytes);
	EXPECT_FALSE(pkg.is_modified());
	EXPECT_EQ(pkg.to_bytes(), bytes);
}

TEST(package_test, replaced_and_added_parts_are_written) {
	const std::string bytes = make_docx(plain_paragraph("Hello"));
	package pkg = package::from_bytes(bytes);
	const std::string root_rels = *pkg.find_part(ROOT_RELS_PART);
	const size_t original_count = pkg.entries().size();
	pkg.set_part(DEFAULT_DOCUMENT_PART, "<replaced/>");
	pkg.set_part("word/extra.xml", "<added/>");
	EXPECT_TRUE(pkg.is_modified());

	const package reloaded = package::from_bytes(pkg.to_bytes());
	ASSERT_NE(reloaded.find_part(DEFAULT_DOCUMENT_PART), nullptr);
	EXPECT_EQ(*reloaded.find_part(DEFAULT_DOCUMENT_PART), "<replaced/>");
	ASSERT_NE(reloaded.find_part("word/extra.xml"), nullptr);
	EXPECT_EQ(*reloaded.find_part("word/extra.xml"), "<added/>");
	EXPECT_EQ(*reloaded.find_part(ROOT_RELS_PART), root_rels);
	EXPECT_EQ(reloaded.entries().size(), original_count + 1);
	EXPECT_EQ(reloaded.entries().front().name, CONTENT_TYPES_PART);
	EXPECT_EQ(reloaded.entries().back().name, "word/extra.xml");
}

TEST(package_test, follows_office_document_relationship) {
	const package pkg = package::from_bytes(make_docx(plain_paragraph("Hello"), "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"/>"));
	EXPECT_EQ(pkg.main_document_part(), "word/document.xml");
	EXPECT_EQ(pkg.related_part("word/document.xml", STYLES_REL_TYPE), "word/styles.xml");
	EXPECT_TRUE(pkg.related_part("word/document.xml", COMMENTS_REL_TYPE).empty());
}

TEST(package_test, relationships_part_names) {
	EXPECT_EQ(package::relationships_part_for(""), "_rels/.rels");
	EXPECT_EQ(package::relationships_part_for("word/document.xml"), "word/_rels/document.xml.rels");
	EXPECT_EQ(package::relationships_part_for("document.xml"), "_rels/document.xml.rels");
}
