/* utils.hpp - header file for shared helpers.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <wx/stream.h>
#include <wx/string.h>
#include <wx/zipstrm.h>

enum class find_options {
	none = 0,
	forward = 1 << 0,
	match_case = 1 << 1
};

inline constexpr find_options operator|(find_options a, find_options b) noexcept {
	return static_cast<find_options>(static_cast<int>(a) | static_cast<int>(b));
}

inline constexpr find_options operator&(find_options a, find_options b) noexcept {
	return static_cast<find_options>(static_cast<int>(a) & static_cast<int>(b));
}

inline constexpr bool has_option(find_options options, find_options flag) noexcept {
	return (options & flag) != find_options::none;
}

[[nodiscard]] long find_text(const wxString& haystack, const wxString& needle, long start, find_options options = find_options::forward);
[[nodiscard]] std::string collapse_whitespace(std::string_view input);
[[nodiscard]] std::string trim_string(const std::string& str);
// Drops C0 control characters XML 1.0 cannot carry; tab, LF and CR are kept.
[[nodiscard]] std::string strip_control_chars(std::string_view input);
[[nodiscard]] std::string get_local_name(const char* qname);
[[nodiscard]] std::string to_utf8(const wxString& str);
[[nodiscard]] std::string xml_to_string(pugi::xml_node node);
[[nodiscard]] std::string read_stream(wxInputStream& stream);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] std::string resolve_part_path(const std::string& source_part, const std::string& target);
