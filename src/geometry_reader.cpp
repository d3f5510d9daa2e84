/* geometry_reader.cpp - page geometry and default font resolution.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "geometry_reader.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace {
// w:sz is in half-points.
constexpr double HALF_POINTS_PER_POINT = 2.0;

double twips_to_inches(pugi::xml_attribute attr) {
	return attr.as_double() / TWIPS_PER_INCH;
}

bool load_related(const document& doc, const char* rel_type, pugi::xml_document& out) {
	const std::string part = doc.pkg.related_part(doc.main_part, rel_type);
	if (part.empty()) {
		return false;
	}
	const std::string* content = doc.pkg.find_part(part);
	if (content == nullptr) {
		return false;
	}
	if (!out.load_buffer(content->data(), content->size())) {
		spdlog::warn("Ignoring unreadable part {}", part);
		return false;
	}
	return true;
}
} // namespace

std::string theme_fonts::resolve(const std::string& theme_slot) const {
	if (theme_slot.starts_with("major")) {
		return major;
	}
	if (theme_slot.starts_with("minor")) {
		return minor;
	}
	return {};
}

page_geometry geometry_reader::read(const document& doc) {
	page_geometry geometry;
	read_section(doc, geometry);
	read_default_font(doc, geometry);
	return geometry;
}

void geometry_reader::read_section(const document& doc, page_geometry& geometry) {
	if (!doc.xml) {
		return;
	}
	const auto section = doc.xml->select_node("//*[local-name()='sectPr']").node();
	if (section == nullptr) {
		return;
	}
	geometry.has_section = true;
	if (const auto margins = section.child("w:pgMar")) {
		geometry.margins.left = twips_to_inches(margins.attribute("w:left"));
		geometry.margins.right = twips_to_inches(margins.attribute("w:right"));
		geometry.margins.top = twips_to_inches(margins.attribute("w:top"));
		geometry.margins.bottom = twips_to_inches(margins.attribute("w:bottom"));
	}
	if (const auto size = section.child("w:pgSz")) {
		geometry.page.width = twips_to_inches(size.attribute("w:w"));
		geometry.page.height = twips_to_inches(size.attribute("w:h"));
	}
}

theme_fonts geometry_reader::read_theme(const document& doc) {
	theme_fonts fonts;
	pugi::xml_document theme;
	if (!load_related(doc, THEME_REL_TYPE, theme)) {
		return fonts;
	}
	const auto scheme = theme.select_node("//*[local-name()='fontScheme']").node();
	for (auto child : scheme.children()) {
		const std::string name = get_local_name(child.name());
		std::string face;
		for (auto font : child.children()) {
			if (get_local_name(font.name()) == "latin") {
				face = font.attribute("typeface").as_string();
				break;
			}
		}
		if (name == "majorFont") {
			fonts.major = face;
		} else if (name == "minorFont") {
			fonts.minor = face;
		}
	}
	return fonts;
}

bool geometry_reader::apply_run_properties(pugi::xml_node rpr_element, const theme_fonts& theme, font_spec& font) {
	if (rpr_element == nullptr) {
		return false;
	}
	bool declared{false};
	if (const auto fonts = rpr_element.child("w:rFonts")) {
		std::string family = fonts.attribute("w:ascii").as_string();
		if (family.empty()) {
			family = fonts.attribute("w:hAnsi").as_string();
		}
		if (family.empty()) {
			family = theme.resolve(fonts.attribute("w:asciiTheme").as_string());
		}
		if (!family.empty()) {
			font.family = family;
			declared = true;
		}
	}
	if (const auto size = rpr_element.child("w:sz")) {
		const double half_points = size.attribute("w:val").as_double();
		if (half_points > 0) {
			font.size = half_points / HALF_POINTS_PER_POINT;
			declared = true;
		}
	}
	return declared;
}

void geometry_reader::read_default_font(const document& doc, page_geometry& geometry) {
	pugi::xml_document styles;
	if (!load_related(doc, STYLES_REL_TYPE, styles)) {
		return;
	}
	const theme_fonts theme = read_theme(doc);
	const auto root = styles.child("w:styles");
	apply_run_properties(root.child("w:docDefaults").child("w:rPrDefault").child("w:rPr"), theme, geometry.default_font);
	for (auto style : root.children("w:style")) {
		const std::string type = style.attribute("w:type").as_string();
		if (type == "paragraph" && style.attribute("w:default").as_bool()) {
			apply_run_properties(style.child("w:rPr"), theme, geometry.default_font);
			break;
		}
	}
}

page_geometry read_page_geometry(const document& doc) {
	return geometry_reader::read(doc);
}
