/* geometry_reader.hpp - header file for the page geometry reader.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include <pugixml.hpp>
#include <string>

struct page_margins {
	double left{0.0};
	double right{0.0};
	double top{0.0};
	double bottom{0.0};
};

struct page_size {
	double width{0.0};
	double height{0.0};
};

struct font_spec {
	std::string family{"Times New Roman"};
	double size{10.0};
};

// Lengths are inches, font sizes points.
struct page_geometry {
	page_margins margins;
	page_size page;
	font_spec default_font;
	bool has_section{false};
};

struct theme_fonts {
	std::string major;
	std::string minor;

	[[nodiscard]] std::string resolve(const std::string& theme_slot) const;
};

class geometry_reader {
public:
	geometry_reader() = delete;

	[[nodiscard]] static page_geometry read(const document& doc);
	[[nodiscard]] static theme_fonts read_theme(const document& doc);
	// Overrides font with whatever the rPr element declares. Returns true if anything was declared.
	static bool apply_run_properties(pugi::xml_node rpr_element, const theme_fonts& theme, font_spec& font);

private:
	static void read_section(const document& doc, page_geometry& geometry);
	static void read_default_font(const document& doc, page_geometry& geometry);
};

[[nodiscard]] page_geometry read_page_geometry(const document& doc);
