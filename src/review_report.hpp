/* review_report.hpp - header file for the per-document review report.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class report_kind {
	span_not_found,
	literal_too_short,
	unknown_chapter,
	finding_limit,
	overlap_conflict
};

enum class report_level {
	info,
	warning
};

struct report_entry {
	report_kind kind{report_kind::span_not_found};
	report_level level{report_level::warning};
	std::optional<size_t> finding_index;
	std::string message;
};

struct review_report {
	size_t findings_received{0};
	size_t findings_processed{0};
	size_t findings_located{0};
	size_t not_found{0};
	size_t skipped{0};
	size_t exact_matches{0};
	size_t normalized_matches{0};
	size_t fuzzy_matches{0};
	size_t spans_applied{0};
	size_t runs_split{0};
	size_t comments_added{0};
	size_t conflicts{0};
	bool cancelled{false};
	std::vector<report_entry> entries;

	void add(report_kind kind, std::optional<size_t> finding_index, std::string message);
	[[nodiscard]] size_t count(report_kind kind) const noexcept;
};

[[nodiscard]] const char* report_kind_name(report_kind kind) noexcept;
[[nodiscard]] report_level default_level(report_kind kind) noexcept;
