/* chapter_segmenter.cpp - chapter segmentation under a character budget.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "chapter_segmenter.hpp"
#include "constants.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <cmath>
#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/tokenzr.h>
#include <wx/translation.h>

namespace {
// Only the start of a paragraph is matched against the heading pattern.
constexpr size_t HEADING_PREFIX_LENGTH = 200;

struct pending_chapter {
	paragraph_range range;
	wxString title;
	int part{1};
};

wxString chapter_title(const pending_chapter& pending) {
	if (pending.part > 1 && !pending.title.IsEmpty()) {
		return wxString::Format("%s (part %d)", pending.title, pending.part);
	}
	return pending.title;
}
} // namespace

chapter_segmenter::chapter_segmenter(segmenter_options opts) : options{std::move(opts)} {
	if (options.heading_pattern.empty()) {
		return;
	}
	try {
		heading_regex = std::regex(options.heading_pattern, std::regex_constants::ECMAScript);
		has_pattern = true;
	} catch (const std::regex_error& e) {
		throw review_exception(wxString::Format(_("Invalid heading pattern '%s': %s"), wxString::FromUTF8(options.heading_pattern), wxString::FromUTF8(e.what())));
	}
}

bool chapter_segmenter::is_heading(const paragraph& para) const {
	if (para.heading_level > 0 && para.heading_level <= options.chapter_heading_level) {
		return true;
	}
	if (!has_pattern) {
		return false;
	}
	const std::string leading = to_utf8(para.text().Left(HEADING_PREFIX_LENGTH));
	return std::regex_search(leading, heading_regex);
}

std::vector<chapter> chapter_segmenter::segment(const document& doc, size_t max_chars) const {
	if (max_chars == 0) {
		throw review_exception(_("Chapter budget must be positive"));
	}
	std::vector<pending_chapter> pending;
	pending_chapter current;
	size_t current_length{0};
	const size_t count = doc.paragraphs.size();
	for (size_t p = 0; p < count; ++p) {
		const auto& para = doc.paragraphs[p];
		const size_t length = para.length();
		const bool heading = is_heading(para);
		if (heading) {
			if (p > current.range.first) {
				current.range.end = p;
				pending.push_back(current);
			}
			current = pending_chapter{{p, p}, wxString::FromUTF8(trim_string(collapse_whitespace(to_utf8(para.text())))), 1};
			current_length = 0;
		} else if (p > current.range.first && current_length + length > max_chars) {
			current.range.end = p;
			pending.push_back(current);
			current = pending_chapter{{p, p}, current.title, current.part + 1};
			current_length = 0;
		}
		current_length += length;
	}
	current.range.end = count;
	if (current.range.first < count || pending.empty()) {
		pending.push_back(current);
	}
	std::vector<chapter> chapters;
	chapters.reserve(pending.size());
	int next_id{1};
	for (const auto& item : pending) {
		chapter ch;
		ch.id = next_id++;
		ch.title = chapter_title(item);
		ch.range = item.range;
		ch.index = flatten(doc, item.range);
		ch.token_estimate = estimate_tokens(ch.index.text);
		chapters.push_back(std::move(ch));
	}
	return chapters;
}

std::vector<chapter> segment_chapters(const document& doc, size_t max_chars, const segmenter_options& options) {
	return chapter_segmenter(options).segment(doc, max_chars);
}

size_t estimate_tokens(const wxString& text) {
	const size_t words = wxStringTokenize(text, " \t\r\n", wxTOKEN_STRTOK).GetCount();
	return static_cast<size_t>(std::lround(static_cast<double>(words) * TOKENS_PER_WORD));
}
