/* text_index.cpp - flattened text index.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "text_index.hpp"
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>
#include <wx/string.h>

void offset_map::add_paragraph(size_t paragraph_index, size_t start, size_t length) {
	paragraphs.push_back({paragraph_index, start, length});
}

void offset_map::add_run(size_t paragraph_index, size_t run_index, size_t start, size_t length) {
	if (length == 0) {
		return;
	}
	runs.push_back({paragraph_index, run_index, start, length});
}

std::optional<run_position> offset_map::to_run(size_t logical) const {
	auto it = std::upper_bound(runs.begin(), runs.end(), logical, [](size_t value, const run_entry& entry) {
		return value < entry.start;
	});
	if (it == runs.begin()) {
		return std::nullopt;
	}
	--it;
	if (logical >= it->start + it->length) {
		return std::nullopt;
	}
	return run_position{it->paragraph_index, it->run_index, logical - it->start};
}

std::optional<size_t> offset_map::to_logical(const run_position& position) const {
	const auto it = std::lower_bound(runs.begin(), runs.end(), position, [](const run_entry& entry, const run_position& pos) {
		if (entry.paragraph_index != pos.paragraph_index) {
			return entry.paragraph_index < pos.paragraph_index;
		}
		return entry.run_index < pos.run_index;
	});
	if (it == runs.end() || it->paragraph_index != position.paragraph_index || it->run_index != position.run_index) {
		return std::nullopt;
	}
	if (position.offset > it->length) {
		return std::nullopt;
	}
	return it->start + position.offset;
}

std::vector<run_slice> offset_map::slices(size_t start, size_t end) const {
	std::vector<run_slice> result;
	if (start >= end) {
		return result;
	}
	auto it = std::upper_bound(runs.begin(), runs.end(), start, [](size_t value, const run_entry& entry) {
		return value < entry.start + entry.length;
	});
	for (; it != runs.end() && it->start < end; ++it) {
		const size_t slice_start = std::max(start, it->start);
		const size_t slice_end = std::min(end, it->start + it->length);
		if (slice_end > slice_start) {
			result.push_back({it->paragraph_index, it->run_index, slice_start - it->start, slice_end - slice_start});
		}
	}
	return result;
}

std::optional<size_t> offset_map::paragraph_start(size_t paragraph_index) const {
	const auto it = std::lower_bound(paragraphs.begin(), paragraphs.end(), paragraph_index, [](const paragraph_entry& entry, size_t index) {
		return entry.paragraph_index < index;
	});
	if (it == paragraphs.end() || it->paragraph_index != paragraph_index) {
		return std::nullopt;
	}
	return it->start;
}

std::optional<size_t> offset_map::paragraph_end(size_t paragraph_index) const {
	const auto it = std::lower_bound(paragraphs.begin(), paragraphs.end(), paragraph_index, [](const paragraph_entry& entry, size_t index) {
		return entry.paragraph_index < index;
	});
	if (it == paragraphs.end() || it->paragraph_index != paragraph_index) {
		return std::nullopt;
	}
	return it->start + it->length;
}

bool offset_map::within_paragraph(size_t start, size_t end) const {
	const auto it = std::upper_bound(paragraphs.begin(), paragraphs.end(), start, [](size_t value, const paragraph_entry& entry) {
		return value < entry.start;
	});
	if (it == paragraphs.begin()) {
		return false;
	}
	const auto& para = *std::prev(it);
	return end <= para.start + para.length;
}

bool offset_map::is_sentinel(size_t logical) const {
	const auto it = std::upper_bound(paragraphs.begin(), paragraphs.end(), logical, [](size_t value, const paragraph_entry& entry) {
		return value < entry.start;
	});
	if (it == paragraphs.begin()) {
		return false;
	}
	const auto& para = *std::prev(it);
	return logical == para.start + para.length;
}

text_index flatten(const document& doc) {
	return flatten(doc, doc.whole());
}

text_index flatten(const document& doc, paragraph_range range) {
	text_index index{wxString(), offset_map(doc.generation()), range, 0};
	range.end = std::min(range.end, doc.paragraphs.size());
	index.range = range;
	size_t offset{0};
	for (size_t p = range.first; p < range.end; ++p) {
		const auto& para = doc.paragraphs[p];
		const size_t paragraph_start = offset;
		for (size_t r = 0; r < para.runs.size(); ++r) {
			const auto& rn = para.runs[r];
			index.map.add_run(p, r, offset, rn.length());
			index.text += rn.text;
			offset += rn.length();
		}
		index.map.add_paragraph(p, paragraph_start, offset - paragraph_start);
		index.char_count += offset - paragraph_start;
		index.text += '\n';
		++offset;
	}
	return index;
}
