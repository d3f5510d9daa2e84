/* integrity_guard.hpp - header file for the package integrity guard.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <string>
#include <wx/string.h>

inline constexpr size_t DEFAULT_MAX_PACKAGE_BYTES = 50 * 1024 * 1024;

class integrity_guard {
public:
	explicit integrity_guard(size_t max_bytes = DEFAULT_MAX_PACKAGE_BYTES) : max_package_bytes{max_bytes} {
	}

	// Structural check of a package. On failure the reason is stored when requested.
	[[nodiscard]] bool verify(const std::string& bytes, wxString* reason = nullptr) const;

	// Throws roundtrip_invariant_violation when the edited package lost text,
	// paragraphs, runs or formatting of the original.
	static void verify_roundtrip(const std::string& before, const std::string& after);

private:
	size_t max_package_bytes;

	void check(const std::string& bytes) const;
};
