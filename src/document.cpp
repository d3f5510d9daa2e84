/* document.cpp - document model.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document.hpp"
#include <cstddef>
#include <sstream>
#include <string>
#include <wx/string.h>

wxString paragraph::text() const {
	wxString result;
	for (const auto& r : runs) {
		result += r.text;
	}
	return result;
}

size_t paragraph::length() const noexcept {
	size_t total{0};
	for (const auto& r : runs) {
		total += r.length();
	}
	return total;
}

size_t document::char_count() const noexcept {
	size_t total{0};
	for (const auto& para : paragraphs) {
		total += para.length();
	}
	return total;
}

size_t document::run_count() const noexcept {
	size_t total{0};
	for (const auto& para : paragraphs) {
		total += para.runs.size();
	}
	return total;
}

std::string document::to_bytes() {
	if (revision > 0 && xml) {
		std::ostringstream out;
		xml->save(out, "", pugi::format_raw, pugi::encoding_utf8);
		pkg.set_part(main_part, out.str());
	}
	return pkg.to_bytes();
}
