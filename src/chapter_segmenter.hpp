/* chapter_segmenter.hpp - header file for the chapter segmenter.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include "text_index.hpp"
#include <regex>
#include <string>
#include <vector>
#include <wx/string.h>

struct segmenter_options {
	int chapter_heading_level{1};
	std::string heading_pattern{R"(^\s*(Chapter|CHAPTER)\s+(\d+|[IVXLC]+)\b)"};
};

struct chapter {
	int id{0};
	wxString title;
	paragraph_range range;
	text_index index;
	size_t token_estimate{0};

	[[nodiscard]] size_t char_count() const noexcept {
		return index.char_count;
	}
};

class chapter_segmenter {
public:
	explicit chapter_segmenter(segmenter_options opts = {});

	[[nodiscard]] bool is_heading(const paragraph& para) const;
	[[nodiscard]] std::vector<chapter> segment(const document& doc, size_t max_chars) const;

private:
	segmenter_options options;
	std::regex heading_regex;
	bool has_pattern{false};
};

[[nodiscard]] std::vector<chapter> segment_chapters(const document& doc, size_t max_chars, const segmenter_options& options = {});
[[nodiscard]] size_t estimate_tokens(const wxString& text);
