/* docx_loader.cpp - loader for wordprocessing documents.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "docx_loader.hpp"
#include "constants.hpp"
#include "document.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <map>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
bool is_wordml(pugi::xml_node node, const char* qualified_name) {
	return node.type() == pugi::node_element && std::string(node.name()) == qualified_name;
}
} // namespace

std::unique_ptr<document> docx_loader::load(const std::string& bytes) {
	auto doc = std::make_unique<document>();
	doc->pkg = package::from_bytes(bytes);
	doc->main_part = doc->pkg.main_document_part();
	const std::string* doc_content = doc->pkg.find_part(doc->main_part);
	if (doc_content == nullptr || doc_content->empty()) {
		throw corrupt_package_error(wxString::Format(_("Package does not contain a main document part (%s)"), wxString::FromUTF8(doc->main_part)));
	}
	doc->xml = std::make_unique<pugi::xml_document>();
	const auto result = doc->xml->load_buffer(doc_content->data(), doc_content->size(), pugi::parse_default | pugi::parse_ws_pcdata | pugi::parse_declaration);
	if (!result) {
		throw corrupt_package_error(wxString::Format(_("Main document part is not valid XML: %s"), result.description()));
	}
	const auto root = doc->xml->document_element();
	if (get_local_name(root.name()) != "document") {
		throw corrupt_package_error(_("Main document part has no document element"));
	}
	const auto body = root.child("w:body");
	if (body == nullptr) {
		throw corrupt_package_error(_("Main document part has no body"));
	}
	read_styles(doc.get());
	traverse(body, doc.get());
	return doc;
}

void docx_loader::traverse(pugi::xml_node node, document* doc) {
	if (node == nullptr) {
		return;
	}
	if (is_wordml(node, "w:p")) {
		process_paragraph(node, doc);
		return; // process_paragraph handles its children
	}
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element) {
			traverse(child, doc);
		}
	}
}

void docx_loader::process_paragraph(pugi::xml_node element, document* doc) {
	paragraph para;
	para.node = element;
	if (const auto ppr = element.child("w:pPr")) {
		para.style_id = ppr.child("w:pStyle").attribute("w:val").as_string();
		para.heading_level = get_paragraph_heading_level(ppr, doc->style_names);
	}
	if (!para.style_id.empty()) {
		const auto it = doc->style_names.find(para.style_id);
		para.style_name = it != doc->style_names.end() ? it->second : para.style_id;
	}
	collect_runs(element, para.runs);
	doc->paragraphs.push_back(std::move(para));
}

void docx_loader::collect_runs(pugi::xml_node container, std::vector<run>& runs) {
	for (auto child : container.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		if (is_wordml(child, "w:r")) {
			runs.push_back(make_run(child));
			continue;
		}
		const std::string local_name = get_local_name(child.name());
		// Deleted revisions are not visible text; nested paragraphs and math keep their own structure.
		if (local_name == "pPr" || local_name == "rPr" || local_name == "del" || local_name == "moveFrom" || local_name == "p" || local_name == "oMath" || local_name == "oMathPara") {
			continue;
		}
		collect_runs(child, runs);
	}
}

run docx_loader::make_run(pugi::xml_node run_element) {
	run r;
	r.node = run_element;
	r.text = wxString::FromUTF8(get_run_text(run_element));
	const auto rpr = run_element.child("w:rPr");
	r.format_signature = format_signature(rpr);
	r.highlight = rpr.child("w:highlight").attribute("w:val").as_string();
	r.anchor = r.text.IsEmpty() && run_element.child("w:commentReference") != nullptr;
	return r;
}

std::string docx_loader::get_run_text(pugi::xml_node run_element) {
	std::string run_text;
	for (auto child : run_element.children()) {
		if (child.type() == pugi::node_element) {
			const std::string local_name = get_local_name(child.name());
			if (local_name == "t") {
				run_text += child.text().as_string();
			} else if (local_name == "tab") {
				run_text += "\t";
			} else if (local_name == "br" || local_name == "cr") {
				run_text += "\n";
			}
		}
	}
	return run_text;
}

bool docx_loader::is_text_element(const std::string& local_name) {
	return local_name == "t" || local_name == "tab" || local_name == "br" || local_name == "cr";
}

std::string docx_loader::format_signature(pugi::xml_node rpr_element) {
	if (rpr_element == nullptr) {
		return {};
	}
	pugi::xml_document scratch;
	auto copy = scratch.append_copy(rpr_element);
	while (auto highlight = copy.child("w:highlight")) {
		copy.remove_child(highlight);
	}
	return xml_to_string(copy);
}

int docx_loader::heading_level_from_style(const std::string& style) {
	if (style.empty()) {
		return 0;
	}
	std::string style_lower = style;
	std::ranges::transform(style_lower, style_lower.begin(), ::tolower);
	if (!style_lower.starts_with("heading")) {
		return 0;
	}
	const size_t num_pos = style.find_first_of("0123456789");
	if (num_pos == std::string::npos) {
		return 0;
	}
	int level{0};
	const auto [ptr, ec] = std::from_chars(style.data() + num_pos, style.data() + style.size(), level);
	if (ec != std::errc{} || level <= 0 || level > MAX_HEADING_LEVEL) {
		return 0;
	}
	return level;
}

int docx_loader::get_paragraph_heading_level(pugi::xml_node pr_element, const std::map<std::string, std::string>& style_names) {
	for (auto child : pr_element.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		const std::string local_name = get_local_name(child.name());
		if (local_name == "pStyle") {
			const std::string style = child.attribute("w:val").as_string();
			int level = heading_level_from_style(style);
			if (level == 0) {
				const auto it = style_names.find(style);
				if (it != style_names.end()) {
					level = heading_level_from_style(it->second);
				}
			}
			if (level > 0) {
				return level;
			}
		} else if (local_name == "outlineLvl") {
			const int level = child.attribute("w:val").as_int(-1) + 1;
			if (level > 0 && level <= MAX_HEADING_LEVEL) {
				return level;
			}
		}
	}
	return 0;
}

void docx_loader::read_styles(document* doc) {
	const std::string styles_part = doc->pkg.related_part(doc->main_part, STYLES_REL_TYPE);
	const std::string* content = doc->pkg.find_part(styles_part);
	if (content == nullptr) {
		return;
	}
	pugi::xml_document styles;
	if (!styles.load_buffer(content->data(), content->size())) {
		return;
	}
	for (auto style : styles.child("w:styles").children("w:style")) {
		const std::string id = style.attribute("w:styleId").as_string();
		const std::string name = style.child("w:name").attribute("w:val").as_string();
		if (!id.empty()) {
			doc->style_names[id] = name.empty() ? id : name;
		}
	}
}
