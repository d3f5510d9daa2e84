/* document.hpp - document model header file.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "package.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <vector>
#include <wx/string.h>

struct run {
	wxString text;
	std::string format_signature;
	std::string highlight;
	pugi::xml_node node;
	bool anchor{false};

	[[nodiscard]] size_t length() const noexcept {
		return text.length();
	}
};

struct paragraph {
	std::string style_id;
	std::string style_name;
	int heading_level{0};
	pugi::xml_node node;
	std::vector<run> runs;

	[[nodiscard]] wxString text() const;
	[[nodiscard]] size_t length() const noexcept;
};

struct paragraph_range {
	size_t first{0};
	size_t end{0};

	[[nodiscard]] size_t size() const noexcept {
		return end > first ? end - first : 0;
	}
};

struct document {
	package pkg;
	std::string main_part;
	std::unique_ptr<pugi::xml_document> xml;
	std::vector<paragraph> paragraphs;
	std::map<std::string, std::string> style_names;

	document() = default;
	~document() = default;
	document(const document&) = delete;
	document& operator=(const document&) = delete;
	document(document&&) = default;
	document& operator=(document&&) = default;

	[[nodiscard]] uint64_t generation() const noexcept {
		return revision;
	}

	[[nodiscard]] size_t char_count() const noexcept;
	[[nodiscard]] size_t run_count() const noexcept;
	[[nodiscard]] paragraph_range whole() const noexcept {
		return {0, paragraphs.size()};
	}

	// Marks the body as changed. Every offset map built earlier becomes stale.
	void touch() noexcept {
		++revision;
	}

	[[nodiscard]] std::string to_bytes();

private:
	uint64_t revision{0};
};
