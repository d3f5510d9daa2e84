/* span_locator.hpp - header file for the span locator.
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
#include "text_index.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct locator_options {
	double fuzzy_threshold{0.85};
	size_t fuzzy_max_literal{400};
};

enum class match_kind {
	none,
	exact,
	normalized,
	fuzzy
};

enum class locate_status {
	found,
	not_found,
	too_short,
	unknown_chapter
};

struct resolved_span {
	size_t paragraph_index{0};
	size_t run_index{0};
	size_t start{0};
	size_t length{0};
	double confidence{0.0};

	[[nodiscard]] size_t end() const noexcept {
		return start + length;
	}
};

struct locate_result {
	locate_status status{locate_status::not_found};
	match_kind kind{match_kind::none};
	double score{0.0};
	std::vector<resolved_span> spans;

	[[nodiscard]] bool found() const noexcept {
		return status == locate_status::found;
	}
};

struct normalized_text {
	std::wstring text;
	std::vector<size_t> origin;
};

// Whitespace runs collapse to one space and typographic punctuation folds to ASCII.
// origin[i] is the input index the i-th output character came from.
[[nodiscard]] normalized_text normalize_for_matching(std::wstring_view input);

// Locates findings inside the chapter they hint at. Holds references only, so the
// document and indexes must outlive it and must not change while it is in use.
class span_locator {
public:
	span_locator(const document& source, const text_index& whole_index, const std::vector<chapter>& doc_chapters, locator_options opts = {});

	[[nodiscard]] locate_result locate(const finding& f) const;

private:
	const document& doc;
	const text_index& whole;
	const std::vector<chapter>& chapters;
	locator_options options;

	void ensure_current(const text_index& index) const;
	[[nodiscard]] std::vector<resolved_span> to_spans(const text_index& scope, size_t start, size_t end, double confidence) const;
};

[[nodiscard]] const char* match_kind_name(match_kind kind) noexcept;
