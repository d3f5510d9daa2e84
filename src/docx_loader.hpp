/* docx_loader.hpp - header file for the wordprocessing structure loader.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include <map>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <vector>

class docx_loader {
public:
	docx_loader() = delete;

	[[nodiscard]] static std::unique_ptr<document> load(const std::string& bytes);
	[[nodiscard]] static run make_run(pugi::xml_node run_element);
	[[nodiscard]] static std::string get_run_text(pugi::xml_node run_element);
	[[nodiscard]] static std::string format_signature(pugi::xml_node rpr_element);
	[[nodiscard]] static bool is_text_element(const std::string& local_name);
	[[nodiscard]] static int get_paragraph_heading_level(pugi::xml_node pr_element, const std::map<std::string, std::string>& style_names);

private:
	static void traverse(pugi::xml_node node, document* doc);
	static void process_paragraph(pugi::xml_node element, document* doc);
	static void collect_runs(pugi::xml_node container, std::vector<run>& runs);
	static void read_styles(document* doc);
	static int heading_level_from_style(const std::string& style);
};
