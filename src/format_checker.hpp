/* format_checker.hpp - header file for the rule-based format checker.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include "finding.hpp"
#include "geometry_reader.hpp"
#include <string>
#include <vector>

inline const char* RULE_AGENT_ID = "tech";

struct review_profile {
	page_margins margins{1.5, 1.0, 1.0, 1.0};
	std::string font_family{"Times New Roman"};
	double font_size{12.0};
	double margin_tolerance{0.02};
	double font_size_tolerance{0.01};
};

struct geometry_check {
	std::string field;
	std::string expected;
	std::string actual;
	bool passed{true};
};

[[nodiscard]] std::vector<geometry_check> compare_geometry(const page_geometry& geometry, const review_profile& profile);
[[nodiscard]] bool all_passed(const std::vector<geometry_check>& checks) noexcept;

// At most one finding per paragraph, at most max_findings overall.
[[nodiscard]] std::vector<finding> check_run_fonts(const document& doc, const review_profile& profile, size_t max_findings);
