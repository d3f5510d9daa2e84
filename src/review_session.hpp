/* review_session.hpp - header file for the review session.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "chapter_segmenter.hpp"
#include "document.hpp"
#include "finding.hpp"
#include "format_checker.hpp"
#include "geometry_reader.hpp"
#include "integrity_guard.hpp"
#include "overlap_resolver.hpp"
#include "review_error.hpp"
#include "review_report.hpp"
#include "run_injector.hpp"
#include "span_locator.hpp"
#include "text_index.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <wx/string.h>

struct session_options {
	locator_options locator;
	segmenter_options segmenter;
	injector_options injector;
	agent_priority priorities;
	size_t max_chars{16000};
	size_t max_findings{10000};
	size_t max_package_bytes{DEFAULT_MAX_PACKAGE_BYTES};
	size_t workers{4};
};

struct apply_result {
	std::string bytes;
	review_report report;
	bool succeeded{true};
	wxString error;
	review_error_code error_code{review_error_code::generic};
};

struct check_result {
	page_geometry geometry;
	std::vector<geometry_check> checks;
	std::vector<finding> font_findings;
};

class review_session {
public:
	explicit review_session(session_options opts = {});

	[[nodiscard]] bool verify(const std::string& bytes, wxString* reason = nullptr) const;
	// The following throw corrupt_package_error when the bytes fail verification.
	[[nodiscard]] std::vector<chapter> locate_chapters(const std::string& bytes) const;
	[[nodiscard]] page_geometry read_page_geometry(const std::string& bytes) const;
	[[nodiscard]] check_result check_format(const std::string& bytes, const review_profile& profile, size_t max_font_findings) const;
	// Never returns partially edited bytes: on failure after loading, result.bytes
	// holds the input unchanged and result.error says why.
	[[nodiscard]] apply_result apply_findings(const std::string& bytes, const std::vector<finding>& findings, const std::atomic<bool>* cancel = nullptr) const;

private:
	session_options options;
	integrity_guard guard;

	[[nodiscard]] std::unique_ptr<document> open(const std::string& bytes) const;
	[[nodiscard]] std::vector<locate_result> locate_all(const span_locator& locator, const std::vector<finding>& findings, size_t count, const std::atomic<bool>* cancel) const;
	void record_locations(const std::vector<finding>& findings, const std::vector<locate_result>& results, size_t count, review_report& report) const;
};
