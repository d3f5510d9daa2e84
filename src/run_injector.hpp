/* run_injector.hpp - header file for the run splitter and annotation injector.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include "overlap_resolver.hpp"
#include <pugixml.hpp>
#include <string>
#include <vector>

struct injector_options {
	std::string major_color{"red"};
	std::string minor_color{"yellow"};
	bool add_comments{true};
	std::string comment_author{"Marginalia"};
	std::string comment_initials{"MG"};
};

struct injection_summary {
	size_t runs_split{0};
	size_t fragments_highlighted{0};
	size_t comments_added{0};
};

class run_injector {
public:
	explicit run_injector(injector_options opts = {});

	// Applies the plan in place. Validation happens before the first mutation,
	// so a rejected plan leaves the document untouched.
	injection_summary apply(document& doc, const edit_plan& plan) const;

	static void set_highlight(pugi::xml_node run_element, const std::string& color);

private:
	injector_options options;

	void validate(const document& doc, const edit_plan& plan) const;
	void split_run(document& doc, size_t paragraph_index, size_t run_index, std::vector<size_t> entries, const edit_plan& plan, std::vector<pugi::xml_node>& targets, injection_summary& summary) const;
	void add_comments(document& doc, const edit_plan& plan, const std::vector<pugi::xml_node>& targets, injection_summary& summary) const;
	[[nodiscard]] const std::string& color_for(severity level) const noexcept;
};
