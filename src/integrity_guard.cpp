/* integrity_guard.cpp - package verification and round-trip invariants.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "integrity_guard.hpp"
#include "constants.hpp"
#include "docx_loader.hpp"
#include "package.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <cstddef>
#include <memory>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
void require_xml_part(const package& pkg, const std::string& name, pugi::xml_document& out) {
	const std::string* content = pkg.find_part(name);
	if (content == nullptr) {
		throw corrupt_package_error(wxString::Format(_("Missing part %s"), wxString::FromUTF8(name)));
	}
	const auto result = out.load_buffer(content->data(), content->size());
	if (!result) {
		throw corrupt_package_error(wxString::Format(_("Part %s is not valid XML: %s"), wxString::FromUTF8(name), result.description()));
	}
}

std::vector<const run*> visible_runs(const paragraph& para) {
	std::vector<const run*> runs;
	for (const auto& r : para.runs) {
		if (!r.anchor) {
			runs.push_back(&r);
		}
	}
	return runs;
}
} // namespace

bool integrity_guard::verify(const std::string& bytes, wxString* reason) const {
	try {
		check(bytes);
		return true;
	} catch (const review_exception& e) {
		spdlog::warn("Package failed verification: {}", to_utf8(e.get_message()));
		if (reason != nullptr) {
			*reason = e.get_message();
		}
	}
	return false;
}

void integrity_guard::check(const std::string& bytes) const {
	if (bytes.size() > max_package_bytes) {
		throw corrupt_package_error(wxString::Format(_("Package of %zu bytes exceeds the %zu byte limit"), bytes.size(), max_package_bytes), review_error_code::package_too_large);
	}
	const package pkg = package::from_bytes(bytes);
	pugi::xml_document types;
	require_xml_part(pkg, CONTENT_TYPES_PART, types);
	if (types.child("Types") == nullptr) {
		throw corrupt_package_error(_("Content types part has no Types element"));
	}
	pugi::xml_document root_rels;
	require_xml_part(pkg, ROOT_RELS_PART, root_rels);
	const std::string main_part = pkg.main_document_part();
	pugi::xml_document main_doc;
	require_xml_part(pkg, main_part, main_doc);
	const auto root = main_doc.document_element();
	if (get_local_name(root.name()) != "document" || root.child("w:body") == nullptr) {
		throw corrupt_package_error(_("Main document part has no document body"));
	}
	const std::string doc_rels = package::relationships_part_for(main_part);
	if (pkg.has_part(doc_rels)) {
		pugi::xml_document rels;
		require_xml_part(pkg, doc_rels, rels);
	}
}

void integrity_guard::verify_roundtrip(const std::string& before, const std::string& after) {
	const auto original = docx_loader::load(before);
	std::unique_ptr<document> edited;
	try {
		edited = docx_loader::load(after);
	} catch (const review_exception& e) {
		throw roundtrip_invariant_violation(wxString::Format(_("Edited package does not load: %s"), e.get_message()));
	}
	if (original->char_count() != edited->char_count()) {
		throw roundtrip_invariant_violation(wxString::Format(_("Visible character count changed from %zu to %zu"), original->char_count(), edited->char_count()));
	}
	if (original->paragraphs.size() != edited->paragraphs.size()) {
		throw roundtrip_invariant_violation(wxString::Format(_("Paragraph count changed from %zu to %zu"), original->paragraphs.size(), edited->paragraphs.size()));
	}
	if (edited->run_count() < original->run_count()) {
		throw roundtrip_invariant_violation(wxString::Format(_("Run count decreased from %zu to %zu"), original->run_count(), edited->run_count()));
	}
	for (size_t p = 0; p < original->paragraphs.size(); ++p) {
		const auto old_runs = visible_runs(original->paragraphs[p]);
		const auto new_runs = visible_runs(edited->paragraphs[p]);
		size_t next{0};
		for (size_t r = 0; r < old_runs.size(); ++r) {
			const run& source = *old_runs[r];
			wxString rebuilt;
			bool formatted{false};
			do {
				if (next >= new_runs.size()) {
					throw roundtrip_invariant_violation(wxString::Format(_("Paragraph %zu lost run %zu"), p, r));
				}
				const run& fragment = *new_runs[next++];
				rebuilt += fragment.text;
				formatted = formatted || fragment.format_signature == source.format_signature;
			} while (rebuilt.length() < source.length());
			if (rebuilt != source.text) {
				throw roundtrip_invariant_violation(wxString::Format(_("Paragraph %zu run %zu text changed"), p, r));
			}
			if (!formatted) {
				throw roundtrip_invariant_violation(wxString::Format(_("Paragraph %zu run %zu lost its formatting"), p, r));
			}
		}
		if (next != new_runs.size()) {
			throw roundtrip_invariant_violation(wxString::Format(_("Paragraph %zu gained runs"), p));
		}
	}
}
