/* run_injector.cpp - run splitting, highlighting and comment anchoring.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "run_injector.hpp"
#include "constants.hpp"
#include "docx_loader.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <pugixml.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
// Elements that follow w:highlight inside w:rPr.
constexpr std::array<std::string_view, 14> AFTER_HIGHLIGHT = {
	"u", "effect", "bdr", "shd", "fitText", "vertAlign", "rtl", "cs", "em", "lang", "eastAsianLayout", "specVanish", "oMath", "rPrChange",
};

bool follows_highlight(const std::string& local_name) {
	return std::ranges::find(AFTER_HIGHLIGHT, local_name) != AFTER_HIGHLIGHT.end();
}

bool needs_preserve(const wxString& text) {
	if (text.IsEmpty()) {
		return false;
	}
	const auto first = text[0];
	const auto last = text[text.length() - 1];
	return first == ' ' || first == '\t' || last == ' ' || last == '\t';
}

// Copies the run in front of itself, keeping only the content in [lo, hi).
pugi::xml_node clone_slice(pugi::xml_node source, size_t lo, size_t hi, size_t length) {
	auto fragment = source.parent().insert_copy_before(source, source);
	std::vector<pugi::xml_node> doomed;
	size_t offset{0};
	for (auto child : fragment.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		const std::string name = get_local_name(child.name());
		if (name == "rPr") {
			continue;
		}
		size_t width{0};
		wxString text;
		if (name == "t") {
			text = wxString::FromUTF8(child.text().as_string());
			width = text.length();
		} else if (docx_loader::is_text_element(name)) {
			width = 1;
		}
		if (width == 0) {
			const bool owned = (offset >= lo && offset < hi) || (offset == length && hi == length);
			if (!owned) {
				doomed.push_back(child);
			}
			continue;
		}
		const size_t from = std::max(offset, lo);
		const size_t to = std::min(offset + width, hi);
		if (from >= to) {
			doomed.push_back(child);
		} else if (name == "t") {
			const wxString part = text.Mid(from - offset, to - from);
			child.text().set(to_utf8(part).c_str());
			if (needs_preserve(part) && child.attribute("xml:space") == nullptr) {
				child.append_attribute("xml:space") = "preserve";
			}
		}
		offset += width;
	}
	for (auto node : doomed) {
		fragment.remove_child(node);
	}
	return fragment;
}

std::string next_relationship_id(const pugi::xml_node& relationships) {
	std::set<std::string> used;
	for (auto rel : relationships.children("Relationship")) {
		used.insert(rel.attribute("Id").as_string());
	}
	int n{1};
	while (used.contains("rId" + std::to_string(n))) {
		++n;
	}
	return "rId" + std::to_string(n);
}

void register_comments_relationship(package& pkg, const std::string& main_part, const std::string& comments_part) {
	const std::string rels_part = package::relationships_part_for(main_part);
	pugi::xml_document rels;
	if (const std::string* content = pkg.find_part(rels_part)) {
		if (!rels.load_buffer(content->data(), content->size(), pugi::parse_default | pugi::parse_declaration)) {
			throw review_exception(wxString::Format(_("Relationships part %s is not valid XML"), wxString::FromUTF8(rels_part)), review_error_code::corrupt_package);
		}
	}
	auto root = rels.child("Relationships");
	if (root == nullptr) {
		auto decl = rels.prepend_child(pugi::node_declaration);
		decl.append_attribute("version") = "1.0";
		decl.append_attribute("encoding") = "UTF-8";
		decl.append_attribute("standalone") = "yes";
		root = rels.append_child("Relationships");
		root.append_attribute("xmlns") = PACKAGE_REL_NS;
	}
	const std::string main_dir = main_part.substr(0, main_part.rfind('/') + 1);
	const std::string target = comments_part.starts_with(main_dir) ? comments_part.substr(main_dir.size()) : "/" + comments_part;
	auto rel = root.append_child("Relationship");
	rel.append_attribute("Id") = next_relationship_id(root).c_str();
	rel.append_attribute("Type") = COMMENTS_REL_TYPE;
	rel.append_attribute("Target") = target.c_str();
	pkg.set_part(rels_part, xml_to_string(rels));
}

void register_comments_content_type(package& pkg, const std::string& comments_part) {
	const std::string* content = pkg.find_part(CONTENT_TYPES_PART);
	if (content == nullptr) {
		throw review_exception(_("Package has no content types part"), review_error_code::corrupt_package);
	}
	pugi::xml_document types;
	if (!types.load_buffer(content->data(), content->size(), pugi::parse_default | pugi::parse_declaration)) {
		throw review_exception(_("Content types part is not valid XML"), review_error_code::corrupt_package);
	}
	auto root = types.child("Types");
	const std::string part_name = "/" + comments_part;
	for (auto over : root.children("Override")) {
		if (part_name == over.attribute("PartName").as_string()) {
			return;
		}
	}
	auto over = root.append_child("Override");
	over.append_attribute("PartName") = part_name.c_str();
	over.append_attribute("ContentType") = COMMENTS_CONTENT_TYPE;
	pkg.set_part(CONTENT_TYPES_PART, xml_to_string(types));
}

long max_comment_id(const pugi::xml_node& root) {
	long highest{-1};
	const auto nodes = root.select_nodes("//*[local-name()='comment' or local-name()='commentRangeStart' or local-name()='commentRangeEnd' or local-name()='commentReference']");
	for (const auto& item : nodes) {
		const auto id = item.node().attribute("w:id");
		if (id != nullptr) {
			highest = std::max(highest, static_cast<long>(id.as_int(-1)));
		}
	}
	return highest;
}
} // namespace

run_injector::run_injector(injector_options opts) : options{std::move(opts)} {
}

injection_summary run_injector::apply(document& doc, const edit_plan& plan) const {
	injection_summary summary;
	if (plan.empty()) {
		return summary;
	}
	validate(doc, plan);
	std::map<std::pair<size_t, size_t>, std::vector<size_t>> by_run;
	for (size_t i = 0; i < plan.entries.size(); ++i) {
		const auto& span = plan.entries[i].span;
		by_run[{span.paragraph_index, span.run_index}].push_back(i);
	}
	std::vector<pugi::xml_node> targets(plan.entries.size());
	// Back to front, so run indices still to be visited are not shifted by insertions.
	for (auto it = by_run.rbegin(); it != by_run.rend(); ++it) {
		split_run(doc, it->first.first, it->first.second, it->second, plan, targets, summary);
	}
	if (options.add_comments) {
		add_comments(doc, plan, targets, summary);
	}
	doc.touch();
	spdlog::debug("Injected {} highlights and {} comments into {} split runs", summary.fragments_highlighted, summary.comments_added, summary.runs_split);
	return summary;
}

void run_injector::validate(const document& doc, const edit_plan& plan) const {
	const edit_entry* previous = nullptr;
	for (const auto& entry : plan.entries) {
		const auto& span = entry.span;
		if (span.paragraph_index >= doc.paragraphs.size() || span.run_index >= doc.paragraphs[span.paragraph_index].runs.size()) {
			throw review_exception(wxString::Format(_("Edit plan refers to a missing run (%zu, %zu)"), span.paragraph_index, span.run_index), review_error_code::invalid_plan);
		}
		const auto& target = doc.paragraphs[span.paragraph_index].runs[span.run_index];
		if (span.length == 0 || span.end() > target.length() || target.anchor) {
			throw review_exception(wxString::Format(_("Edit plan range %zu+%zu does not fit run (%zu, %zu)"), span.start, span.length, span.paragraph_index, span.run_index), review_error_code::invalid_plan);
		}
		if (entry.comment_group >= plan.group_count) {
			throw review_exception(wxString::Format(_("Edit plan refers to unknown comment group %zu"), entry.comment_group), review_error_code::invalid_plan);
		}
		if (previous != nullptr) {
			const auto& prev = previous->span;
			const bool ordered = prev.paragraph_index < span.paragraph_index || (prev.paragraph_index == span.paragraph_index && (prev.run_index < span.run_index || (prev.run_index == span.run_index && prev.end() <= span.start)));
			if (!ordered) {
				throw review_exception(_("Edit plan entries overlap or are out of document order"), review_error_code::invalid_plan);
			}
		}
		previous = &entry;
	}
}

void run_injector::split_run(document& doc, size_t paragraph_index, size_t run_index, std::vector<size_t> entries, const edit_plan& plan, std::vector<pugi::xml_node>& targets, injection_summary& summary) const {
	auto& para = doc.paragraphs[paragraph_index];
	const pugi::xml_node original = para.runs[run_index].node;
	const size_t length = para.runs[run_index].length();
	std::vector<size_t> bounds{0, length};
	for (const size_t i : entries) {
		bounds.push_back(plan.entries[i].span.start);
		bounds.push_back(plan.entries[i].span.end());
	}
	std::ranges::sort(bounds);
	bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());
	if (bounds.size() == 2) {
		const auto& entry = plan.entries[entries.front()];
		set_highlight(original, color_for(entry.level));
		targets[entries.front()] = original;
		para.runs[run_index] = docx_loader::make_run(original);
		++summary.fragments_highlighted;
		return;
	}
	std::vector<run> fragments;
	fragments.reserve(bounds.size() - 1);
	for (size_t b = 0; b + 1 < bounds.size(); ++b) {
		const size_t lo = bounds[b];
		auto fragment = clone_slice(original, lo, bounds[b + 1], length);
		for (const size_t i : entries) {
			if (plan.entries[i].span.start == lo) {
				set_highlight(fragment, color_for(plan.entries[i].level));
				targets[i] = fragment;
				++summary.fragments_highlighted;
			}
		}
		fragments.push_back(docx_loader::make_run(fragment));
	}
	original.parent().remove_child(original);
	auto pos = para.runs.erase(para.runs.begin() + static_cast<std::ptrdiff_t>(run_index));
	para.runs.insert(pos, std::make_move_iterator(fragments.begin()), std::make_move_iterator(fragments.end()));
	++summary.runs_split;
}

void run_injector::add_comments(document& doc, const edit_plan& plan, const std::vector<pugi::xml_node>& targets, injection_summary& summary) const {
	std::map<size_t, std::pair<size_t, size_t>> groups;
	for (size_t i = 0; i < plan.entries.size(); ++i) {
		if (plan.entries[i].note.empty()) {
			continue;
		}
		const auto [it, inserted] = groups.try_emplace(plan.entries[i].comment_group, i, i);
		if (!inserted) {
			it->second.second = i;
		}
	}
	if (groups.empty()) {
		return;
	}
	auto& pkg = doc.pkg;
	std::string comments_part = pkg.related_part(doc.main_part, COMMENTS_REL_TYPE);
	const bool has_relationship = !comments_part.empty();
	if (!has_relationship) {
		comments_part = resolve_part_path(doc.main_part, "comments.xml");
	}
	pugi::xml_document comments;
	const std::string* existing = pkg.find_part(comments_part);
	if (existing != nullptr) {
		if (!comments.load_buffer(existing->data(), existing->size(), pugi::parse_default | pugi::parse_ws_pcdata | pugi::parse_declaration)) {
			throw review_exception(wxString::Format(_("Comments part %s is not valid XML"), wxString::FromUTF8(comments_part)), review_error_code::corrupt_package);
		}
	}
	auto root = comments.child("w:comments");
	if (root == nullptr) {
		comments.reset();
		auto decl = comments.append_child(pugi::node_declaration);
		decl.append_attribute("version") = "1.0";
		decl.append_attribute("encoding") = "UTF-8";
		decl.append_attribute("standalone") = "yes";
		root = comments.append_child("w:comments");
		root.append_attribute("xmlns:w") = WORDML_NS;
	}
	long next_id = std::max(max_comment_id(comments), max_comment_id(*doc.xml)) + 1;
	for (const auto& [group, range] : groups) {
		const auto& first = plan.entries[range.first];
		const auto& last = plan.entries[range.second];
		const std::string id = std::to_string(next_id++);
		auto first_node = targets[range.first];
		auto last_node = targets[range.second];
		first_node.parent().insert_child_before("w:commentRangeStart", first_node).append_attribute("w:id") = id.c_str();
		auto range_end = last_node.parent().insert_child_after("w:commentRangeEnd", last_node);
		range_end.append_attribute("w:id") = id.c_str();
		auto reference = last_node.parent().insert_child_after("w:r", range_end);
		reference.append_child("w:commentReference").append_attribute("w:id") = id.c_str();
		auto& runs = doc.paragraphs[last.span.paragraph_index].runs;
		const auto at = std::ranges::find_if(runs, [&](const run& r) {
			return r.node == last_node;
		});
		runs.insert(at == runs.end() ? at : at + 1, docx_loader::make_run(reference));

		auto comment = root.append_child("w:comment");
		comment.append_attribute("w:id") = id.c_str();
		comment.append_attribute("w:author") = strip_control_chars(options.comment_author).c_str();
		comment.append_attribute("w:initials") = strip_control_chars(options.comment_initials).c_str();
		const wxString label = wxString::FromUTF8(severity_name(first.level)).Upper();
		const std::string body = to_utf8(wxString::Format("[%s] ", label)) + first.note;
		auto text = comment.append_child("w:p").append_child("w:r").append_child("w:t");
		text.append_attribute("xml:space") = "preserve";
		text.text().set(strip_control_chars(body).c_str());
		++summary.comments_added;
	}
	pkg.set_part(comments_part, xml_to_string(comments));
	if (!has_relationship) {
		register_comments_relationship(pkg, doc.main_part, comments_part);
	}
	register_comments_content_type(pkg, comments_part);
}

void run_injector::set_highlight(pugi::xml_node run_element, const std::string& color) {
	auto rpr = run_element.child("w:rPr");
	if (rpr == nullptr) {
		rpr = run_element.prepend_child("w:rPr");
	}
	auto highlight = rpr.child("w:highlight");
	if (highlight == nullptr) {
		pugi::xml_node before;
		for (auto child : rpr.children()) {
			if (child.type() == pugi::node_element && follows_highlight(get_local_name(child.name()))) {
				before = child;
				break;
			}
		}
		highlight = before != nullptr ? rpr.insert_child_before("w:highlight", before) : rpr.append_child("w:highlight");
	}
	auto val = highlight.attribute("w:val");
	if (val == nullptr) {
		val = highlight.append_attribute("w:val");
	}
	val = color.c_str();
}

const std::string& run_injector::color_for(severity level) const noexcept {
	return level == severity::major ? options.major_color : options.minor_color;
}
