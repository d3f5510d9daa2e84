/* package.hpp - header file for the OOXML zip container.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

struct package_entry {
	std::string name;
	std::string data;
	bool modified{false};
	bool added{false};
};

// In-memory view of a zip package. Entries that are never replaced are copied
// to the output without recompression, so their stored bytes stay identical.
class package {
public:
	package() = default;
	~package() = default;
	package(const package&) = delete;
	package& operator=(const package&) = delete;
	package(package&&) = default;
	package& operator=(package&&) = default;

	[[nodiscard]] static package from_bytes(const std::string& bytes);
	[[nodiscard]] std::string to_bytes() const;

	[[nodiscard]] bool has_part(const std::string& name) const noexcept;
	[[nodiscard]] const std::string* find_part(const std::string& name) const noexcept;
	void set_part(const std::string& name, std::string data);

	[[nodiscard]] const std::vector<package_entry>& entries() const noexcept {
		return parts;
	}

	[[nodiscard]] bool is_modified() const noexcept;
	[[nodiscard]] std::string main_document_part() const;
	[[nodiscard]] std::map<std::string, std::string> relationships(const std::string& source_part, const std::string& type = {}) const;
	[[nodiscard]] std::string related_part(const std::string& source_part, const std::string& type) const;
	[[nodiscard]] static std::string relationships_part_for(const std::string& source_part);

private:
	std::string source;
	std::vector<package_entry> parts;
	std::map<std::string, size_t> part_index;
};
