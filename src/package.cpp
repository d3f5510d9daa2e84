/* package.cpp - OOXML zip container.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "package.hpp"
#include "constants.hpp"
#include "review_error.hpp"
#include "utils.hpp"
#include <map>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <utility>
#include <vector>
#include <wx/datetime.h>
#include <wx/mstream.h>
#include <wx/translation.h>
#include <wx/zipstrm.h>

package package::from_bytes(const std::string& bytes) {
	if (bytes.empty()) {
		throw corrupt_package_error(_("Package is empty"));
	}
	package pkg;
	pkg.source = bytes;
	wxMemoryInputStream mem(bytes.data(), bytes.size());
	wxZipInputStream zip(mem);
	if (!zip.IsOk()) {
		throw corrupt_package_error(_("Package is not a zip archive"));
	}
	std::unique_ptr<wxZipEntry> entry;
	while ((entry.reset(zip.GetNextEntry())), entry != nullptr) {
		if (entry->IsDir()) {
			continue;
		}
		package_entry part;
		part.name = entry->GetInternalName().ToStdString();
		part.data = read_zip_entry(zip);
		if (zip.GetLastError() == wxSTREAM_READ_ERROR) {
			throw corrupt_package_error(wxString::Format(_("Failed to read package part %s"), wxString::FromUTF8(part.name)));
		}
		pkg.part_index[part.name] = pkg.parts.size();
		pkg.parts.push_back(std::move(part));
	}
	if (pkg.parts.empty()) {
		throw corrupt_package_error(_("Package is not a zip archive or contains no parts"));
	}
	return pkg;
}

std::string package::to_bytes() const {
	if (!is_modified()) {
		return source;
	}
	wxMemoryInputStream mem_in(source.data(), source.size());
	wxZipInputStream zip_in(mem_in);
	wxMemoryOutputStream mem_out;
	{
		wxZipOutputStream zip_out(mem_out);
		zip_out.CopyArchiveMetaData(zip_in);
		std::unique_ptr<wxZipEntry> entry;
		while ((entry.reset(zip_in.GetNextEntry())), entry != nullptr) {
			const std::string name = entry->GetInternalName().ToStdString();
			const auto it = part_index.find(name);
			if (it == part_index.end() || !parts[it->second].modified) {
				if (!zip_out.CopyEntry(entry.release(), zip_in)) {
					throw review_exception(wxString::Format(_("Failed to copy package part %s"), wxString::FromUTF8(name)));
				}
				continue;
			}
			const auto& data = parts[it->second].data;
			zip_out.PutNextEntry(new wxZipEntry(entry->GetName(), entry->GetDateTime()));
			zip_out.Write(data.data(), data.size());
		}
		const wxDateTime zip_epoch(1, wxDateTime::Jan, 1980);
		for (const auto& part : parts) {
			if (!part.added) {
				continue;
			}
			zip_out.PutNextEntry(new wxZipEntry(wxString::FromUTF8(part.name), zip_epoch));
			zip_out.Write(part.data.data(), part.data.size());
		}
		if (!zip_out.Close()) {
			throw review_exception(_("Failed to write package"));
		}
	}
	const size_t size = static_cast<size_t>(mem_out.GetSize());
	std::string out(size, '\0');
	mem_out.CopyTo(out.data(), size);
	return out;
}

bool package::has_part(const std::string& name) const noexcept {
	return part_index.contains(name);
}

const std::string* package::find_part(const std::string& name) const noexcept {
	const auto it = part_index.find(name);
	if (it == part_index.end()) {
		return nullptr;
	}
	return &parts[it->second].data;
}

void package::set_part(const std::string& name, std::string data) {
	const auto it = part_index.find(name);
	if (it != part_index.end()) {
		auto& part = parts[it->second];
		part.data = std::move(data);
		part.modified = true;
		return;
	}
	package_entry part;
	part.name = name;
	part.data = std::move(data);
	part.modified = true;
	part.added = true;
	part_index[name] = parts.size();
	parts.push_back(std::move(part));
}

bool package::is_modified() const noexcept {
	for (const auto& part : parts) {
		if (part.modified) {
			return true;
		}
	}
	return false;
}

std::string package::main_document_part() const {
	const std::string target = related_part("", OFFICE_DOCUMENT_REL_TYPE);
	return target.empty() ? DEFAULT_DOCUMENT_PART : target;
}

std::map<std::string, std::string> package::relationships(const std::string& source_part, const std::string& type) const {
	std::map<std::string, std::string> rels;
	const std::string* content = find_part(relationships_part_for(source_part));
	if (content == nullptr) {
		return rels;
	}
	pugi::xml_document rels_doc;
	if (!rels_doc.load_buffer(content->data(), content->size())) {
		return rels;
	}
	for (auto rel : rels_doc.child("Relationships").children("Relationship")) {
		if (!type.empty() && type != rel.attribute("Type").as_string()) {
			continue;
		}
		const std::string id = rel.attribute("Id").as_string();
		const std::string target = rel.attribute("Target").as_string();
		const std::string mode = rel.attribute("TargetMode").as_string();
		rels[id] = mode == "External" ? target : resolve_part_path(source_part, target);
	}
	return rels;
}

std::string package::related_part(const std::string& source_part, const std::string& type) const {
	const auto rels = relationships(source_part, type);
	return rels.empty() ? std::string{} : rels.begin()->second;
}

std::string package::relationships_part_for(const std::string& source_part) {
	if (source_part.empty()) {
		return ROOT_RELS_PART;
	}
	const size_t slash = source_part.rfind('/');
	if (slash == std::string::npos) {
		return "_rels/" + source_part + ".rels";
	}
	return source_part.substr(0, slash + 1) + "_rels/" + source_part.substr(slash + 1) + ".rels";
}
