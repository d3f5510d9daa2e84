/* text_index.hpp - header file for the flattened text index.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include <cstdint>
#include <optional>
#include <vector>
#include <wx/string.h>

struct run_position {
	size_t paragraph_index{0};
	size_t run_index{0};
	size_t offset{0};

	[[nodiscard]] bool operator==(const run_position& other) const noexcept = default;
};

struct run_slice {
	size_t paragraph_index{0};
	size_t run_index{0};
	size_t start{0};
	size_t length{0};
};

// Maps logical offsets of a flattened string to run coordinates and back.
// Each paragraph is followed by a sentinel that belongs to no run.
class offset_map {
public:
	explicit offset_map(uint64_t doc_generation = 0) : generation{doc_generation} {
	}

	void add_paragraph(size_t paragraph_index, size_t start, size_t length);
	void add_run(size_t paragraph_index, size_t run_index, size_t start, size_t length);

	[[nodiscard]] std::optional<run_position> to_run(size_t logical) const;
	[[nodiscard]] std::optional<size_t> to_logical(const run_position& position) const;
	[[nodiscard]] std::vector<run_slice> slices(size_t start, size_t end) const;
	[[nodiscard]] std::optional<size_t> paragraph_start(size_t paragraph_index) const;
	// Offset of the paragraph's sentinel.
	[[nodiscard]] std::optional<size_t> paragraph_end(size_t paragraph_index) const;
	// True when [start, end) lies inside one paragraph and covers no sentinel.
	[[nodiscard]] bool within_paragraph(size_t start, size_t end) const;
	[[nodiscard]] bool is_sentinel(size_t logical) const;

	[[nodiscard]] uint64_t built_for() const noexcept {
		return generation;
	}

private:
	struct run_entry {
		size_t paragraph_index;
		size_t run_index;
		size_t start;
		size_t length;
	};

	struct paragraph_entry {
		size_t paragraph_index;
		size_t start;
		size_t length;
	};

	uint64_t generation;
	std::vector<paragraph_entry> paragraphs;
	std::vector<run_entry> runs;
};

struct text_index {
	wxString text;
	offset_map map;
	paragraph_range range;
	size_t char_count{0};
};

[[nodiscard]] text_index flatten(const document& doc);
[[nodiscard]] text_index flatten(const document& doc, paragraph_range range);
