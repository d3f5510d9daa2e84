/* format_checker.cpp - page and font checks against a review profile.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "format_checker.hpp"
#include "constants.hpp"
#include "text_index.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
std::string format_number(double value) {
	return to_utf8(wxString::Format("%.2f", value));
}

bool same_family(const std::string& a, const std::string& b) {
	return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
		return std::tolower(x) == std::tolower(y);
	});
}

geometry_check numeric_check(const char* field, double expected, double actual, double tolerance) {
	return {field, format_number(expected), format_number(actual), std::fabs(expected - actual) <= tolerance + 1e-9};
}
} // namespace

std::vector<geometry_check> compare_geometry(const page_geometry& geometry, const review_profile& profile) {
	const double tol = profile.margin_tolerance;
	std::vector<geometry_check> checks{
		numeric_check("margin_left", profile.margins.left, geometry.margins.left, tol),
		numeric_check("margin_right", profile.margins.right, geometry.margins.right, tol),
		numeric_check("margin_top", profile.margins.top, geometry.margins.top, tol),
		numeric_check("margin_bottom", profile.margins.bottom, geometry.margins.bottom, tol),
		numeric_check("font_size", profile.font_size, geometry.default_font.size, profile.font_size_tolerance),
	};
	checks.push_back({"font_family", profile.font_family, geometry.default_font.family, same_family(profile.font_family, geometry.default_font.family)});
	return checks;
}

bool all_passed(const std::vector<geometry_check>& checks) noexcept {
	return std::ranges::all_of(checks, [](const geometry_check& c) {
		return c.passed;
	});
}

std::vector<finding> check_run_fonts(const document& doc, const review_profile& profile, size_t max_findings) {
	std::vector<finding> findings;
	const theme_fonts theme = geometry_reader::read_theme(doc);
	const text_index index = flatten(doc);
	for (size_t p = 0; p < doc.paragraphs.size() && findings.size() < max_findings; ++p) {
		const auto& runs = doc.paragraphs[p].runs;
		for (size_t i = 0; i < runs.size(); ++i) {
			const run& r = runs[i];
			const std::string literal = trim_string(to_utf8(r.text));
			if (r.anchor || wxString::FromUTF8(literal).length() < MIN_LITERAL_LENGTH) {
				continue;
			}
			const auto rpr = r.node.child("w:rPr");
			font_spec declared{"", 0.0};
			if (!geometry_reader::apply_run_properties(rpr, theme, declared)) {
				continue;
			}
			finding f;
			f.hint.paragraph = p;
			// Points the locator at this run rather than an equal text elsewhere in the paragraph.
			const size_t leading = r.text.length() - wxString(r.text).Trim(false).length();
			f.hint.offset = index.map.to_logical({p, i, leading});
			f.literal_text = literal;
			f.agent_id = RULE_AGENT_ID;
			if (!declared.family.empty() && !same_family(declared.family, profile.font_family)) {
				f.level = severity::major;
				f.note = to_utf8(wxString::Format(_("Font %s does not match the required %s"), wxString::FromUTF8(declared.family), wxString::FromUTF8(profile.font_family)));
			} else if (declared.size > 0.0 && std::fabs(declared.size - profile.font_size) > profile.font_size_tolerance) {
				f.level = severity::minor;
				f.note = to_utf8(wxString::Format(_("Font size %s pt does not match the required %s pt"), format_number(declared.size), format_number(profile.font_size)));
			} else {
				continue;
			}
			findings.push_back(std::move(f));
			break;
		}
	}
	if (!findings.empty() && findings.size() >= max_findings) {
		spdlog::warn("Font checks stopped at {} findings", max_findings);
	}
	return findings;
}
