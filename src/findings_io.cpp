/* findings_io.cpp - JSON input and output of findings, reports, chapters and geometry.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "findings_io.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

using nlohmann::json;

namespace {
constexpr int JSON_INDENT = 2;
constexpr size_t MAX_INDEX_DIGITS = 18;

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
	return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
		return std::tolower(x) == std::tolower(y);
	});
}

std::string string_field(const json& j, const char* key) {
	if (!j.contains(key)) {
		return {};
	}
	const auto& value = j[key];
	if (value.is_string()) {
		return value.get<std::string>();
	}
	if (value.is_number()) {
		return value.dump();
	}
	return {};
}

template <typename T>
std::optional<T> index_field(const json& j, const char* key) {
	if (!j.contains(key)) {
		return std::nullopt;
	}
	const auto& value = j[key];
	if (value.is_number_integer() && value.get<long long>() >= 0) {
		return static_cast<T>(value.get<long long>());
	}
	if (value.is_string()) {
		const std::string text = value.get<std::string>();
		if (!text.empty() && text.size() <= MAX_INDEX_DIGITS && std::ranges::all_of(text, [](unsigned char c) {
				return std::isdigit(c) != 0;
			})) {
			return static_cast<T>(std::stoll(text));
		}
	}
	return std::nullopt;
}

finding parse_finding(const json& item, size_t index) {
	if (!item.is_object()) {
		throw review_exception(wxString::Format(_("Finding %zu is not an object"), index), review_error_code::invalid_findings);
	}
	finding f;
	if (item.contains("location") && item["location"].is_object()) {
		const auto& loc = item["location"];
		f.hint.chapter_id = index_field<int>(loc, "chapter");
		f.hint.offset = index_field<size_t>(loc, "offset");
		f.hint.paragraph = index_field<size_t>(loc, "paragraph");
		f.literal_text = string_field(loc, "text");
	}
	if (f.literal_text.empty()) {
		f.literal_text = string_field(item, "text");
	}
	f.level = severity_from_string(string_field(item, "severity"));
	f.agent_id = string_field(item, "agent");
	f.note = string_field(item, "note");
	if (f.note.empty()) {
		f.note = string_field(item, "issue");
		const std::string suggestion = string_field(item, "suggestion");
		if (!suggestion.empty()) {
			f.note += f.note.empty() ? suggestion : " " + to_utf8(wxString::Format(_("Suggestion: %s"), wxString::FromUTF8(suggestion)));
		}
	}
	return f;
}

json hint_to_json(const location_hint& hint) {
	json loc = json::object();
	if (hint.chapter_id) {
		loc["chapter"] = *hint.chapter_id;
	}
	if (hint.offset) {
		loc["offset"] = *hint.offset;
	}
	if (hint.paragraph) {
		loc["paragraph"] = *hint.paragraph;
	}
	return loc;
}
} // namespace

severity severity_from_string(std::string_view value) noexcept {
	for (const std::string_view alias : {"major", "high", "critical"}) {
		if (equals_ignore_case(value, alias)) {
			return severity::major;
		}
	}
	return severity::minor;
}

const char* severity_name(severity level) noexcept {
	return level == severity::major ? "major" : "minor";
}

std::vector<finding> parse_findings(const std::string& json_text) {
	auto j = json::parse(json_text, nullptr, false);
	if (j.is_discarded()) {
		throw review_exception(_("Findings are not valid JSON"), review_error_code::invalid_findings);
	}
	const json* list = &j;
	if (j.is_object()) {
		if (j.contains("findings")) {
			list = &j["findings"];
		} else if (j.contains("issues")) {
			list = &j["issues"];
		}
	}
	if (!list->is_array()) {
		throw review_exception(_("Findings must be a JSON array"), review_error_code::invalid_findings);
	}
	std::vector<finding> findings;
	findings.reserve(list->size());
	size_t index{0};
	for (const auto& item : *list) {
		findings.push_back(parse_finding(item, index++));
	}
	return findings;
}

std::string findings_to_json(const std::vector<finding>& findings) {
	json out = json::array();
	for (const auto& f : findings) {
		json loc = hint_to_json(f.hint);
		loc["text"] = f.literal_text;
		out.push_back({
			{"location", loc},
			{"severity", severity_name(f.level)},
			{"agent", f.agent_id},
			{"note", f.note},
		});
	}
	return out.dump(JSON_INDENT);
}

std::string report_to_json(const review_report& report) {
	json entries = json::array();
	for (const auto& e : report.entries) {
		json entry{
			{"kind", report_kind_name(e.kind)},
			{"level", e.level == report_level::info ? "info" : "warning"},
			{"message", e.message},
		};
		if (e.finding_index) {
			entry["finding"] = *e.finding_index;
		}
		entries.push_back(std::move(entry));
	}
	json out{
		{"findings_received", report.findings_received},
		{"findings_processed", report.findings_processed},
		{"findings_located", report.findings_located},
		{"not_found", report.not_found},
		{"skipped", report.skipped},
		{"exact_matches", report.exact_matches},
		{"normalized_matches", report.normalized_matches},
		{"fuzzy_matches", report.fuzzy_matches},
		{"spans_applied", report.spans_applied},
		{"runs_split", report.runs_split},
		{"comments_added", report.comments_added},
		{"conflicts", report.conflicts},
		{"cancelled", report.cancelled},
		{"entries", entries},
	};
	return out.dump(JSON_INDENT);
}

std::string chapters_to_json(const std::vector<chapter>& chapters) {
	json out = json::array();
	for (const auto& ch : chapters) {
		out.push_back({
			{"id", ch.id},
			{"title", to_utf8(ch.title)},
			{"first_paragraph", ch.range.first},
			{"end_paragraph", ch.range.end},
			{"char_count", ch.char_count()},
			{"token_estimate", ch.token_estimate},
		});
	}
	return out.dump(JSON_INDENT);
}

std::string geometry_to_json(const page_geometry& geometry, const std::vector<geometry_check>& checks) {
	json out{
		{"margin_left", geometry.margins.left},
		{"margin_right", geometry.margins.right},
		{"margin_top", geometry.margins.top},
		{"margin_bottom", geometry.margins.bottom},
		{"page_width", geometry.page.width},
		{"page_height", geometry.page.height},
		{"font_family", geometry.default_font.family},
		{"font_size", geometry.default_font.size},
		{"has_section", geometry.has_section},
	};
	if (!checks.empty()) {
		json deviations = json::array();
		for (const auto& c : checks) {
			if (!c.passed) {
				deviations.push_back({{"field", c.field}, {"expected", c.expected}, {"actual", c.actual}});
			}
		}
		out["deviations"] = deviations;
		out["passed"] = deviations.empty();
	}
	return out.dump(JSON_INDENT);
}
