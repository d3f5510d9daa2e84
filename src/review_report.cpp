/* review_report.cpp - per-document review report.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "review_report.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

void review_report::add(report_kind kind, std::optional<size_t> finding_index, std::string message) {
	report_entry entry;
	entry.kind = kind;
	entry.level = default_level(kind);
	entry.finding_index = finding_index;
	entry.message = std::move(message);
	if (entry.level == report_level::warning) {
		spdlog::warn("{}: {}", report_kind_name(kind), entry.message);
	} else {
		spdlog::debug("{}: {}", report_kind_name(kind), entry.message);
	}
	if (kind == report_kind::overlap_conflict) {
		++conflicts;
	}
	entries.push_back(std::move(entry));
}

size_t review_report::count(report_kind kind) const noexcept {
	return static_cast<size_t>(std::ranges::count_if(entries, [kind](const report_entry& e) {
		return e.kind == kind;
	}));
}

const char* report_kind_name(report_kind kind) noexcept {
	switch (kind) {
		case report_kind::span_not_found:
			return "span_not_found";
		case report_kind::literal_too_short:
			return "literal_too_short";
		case report_kind::unknown_chapter:
			return "unknown_chapter";
		case report_kind::finding_limit:
			return "finding_limit";
		case report_kind::overlap_conflict:
			return "overlap_conflict";
	}
	return "unknown";
}

report_level default_level(report_kind kind) noexcept {
	return kind == report_kind::overlap_conflict ? report_level::info : report_level::warning;
}
