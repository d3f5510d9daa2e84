/* utils.cpp - shared helpers.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <cctype>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <wx/string.h>
#include <wx/zipstrm.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;

long find_text_literal(const wxString& haystack, const wxString& needle, long start, find_options options) {
	const auto forward = has_option(options, find_options::forward);
	const auto match_case = has_option(options, find_options::match_case);
	const auto& search_haystack = match_case ? haystack : haystack.Lower();
	const auto& search_needle = match_case ? needle : needle.Lower();
	const size_t pos = forward ? search_haystack.find(search_needle, static_cast<size_t>(start)) : search_haystack.Left(static_cast<size_t>(start)).rfind(search_needle);
	return pos == wxString::npos ? wxNOT_FOUND : static_cast<long>(pos);
}
} // namespace

long find_text(const wxString& haystack, const wxString& needle, long start, find_options options) {
	if (needle.empty() || start < 0) {
		return wxNOT_FOUND;
	}
	return find_text_literal(haystack, needle, start, options);
}

std::string collapse_whitespace(std::string_view input) {
	auto result = std::ostringstream{};
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		// Check for non-breaking space (UTF-8: 0xC2A0)
		const bool is_nbsp = (i + 1 < input.size() && ch == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result << ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i; // Skip the second byte of the UTF-8 sequence.
			}
		} else {
			result << input[i];
			prev_was_space = false;
		}
	}
	return result.str();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && std::prev(prev) != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string strip_control_chars(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	for (const char c : input) {
		const auto ch = static_cast<unsigned char>(c);
		if (ch < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') {
			continue;
		}
		result += c;
	}
	return result;
}

std::string get_local_name(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	std::string s(qname);
	size_t pos{s.find(':')};
	return pos == std::string::npos ? s : s.substr(pos + 1);
}

std::string to_utf8(const wxString& str) {
	const auto buffer = str.utf8_str();
	return {buffer.data(), buffer.length()};
}

std::string xml_to_string(pugi::xml_node node) {
	if (node == nullptr) {
		return {};
	}
	std::ostringstream out;
	node.print(out, "", pugi::format_raw, pugi::encoding_utf8);
	return out.str();
}

std::string read_stream(wxInputStream& stream) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (stream.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(stream.LastRead()));
	}
	return buffer.str();
}

std::string read_zip_entry(wxZipInputStream& zip) {
	return read_stream(zip);
}

std::string resolve_part_path(const std::string& source_part, const std::string& target) {
	if (target.empty()) {
		return {};
	}
	if (target.front() == '/') {
		return target.substr(1);
	}
	std::string base;
	const size_t slash = source_part.rfind('/');
	if (slash != std::string::npos) {
		base = source_part.substr(0, slash + 1);
	}
	std::vector<std::string> segments;
	std::istringstream path(base + target);
	std::string segment;
	while (std::getline(path, segment, '/')) {
		if (segment.empty() || segment == ".") {
			continue;
		}
		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
			continue;
		}
		segments.push_back(segment);
	}
	std::string resolved;
	for (const auto& part : segments) {
		if (!resolved.empty()) {
			resolved += '/';
		}
		resolved += part;
	}
	return resolved;
}
