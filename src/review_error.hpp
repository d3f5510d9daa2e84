/* review_error.hpp - error types raised by the review core.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <wx/string.h>

enum class error_severity {
	error,
	warning
};

enum class review_error_code {
	generic,
	corrupt_package,
	package_too_large,
	invalid_findings,
	invalid_plan,
	stale_index,
	roundtrip_violation
};

class review_exception : public std::runtime_error {
public:
	review_exception(const wxString& msg, review_error_code code = review_error_code::generic, error_severity sev = error_severity::error) : std::runtime_error(msg.ToStdString()), message{msg}, severity{sev}, error_code{code} {
	}
	review_exception(const wxString& msg, const wxString& fp, review_error_code code = review_error_code::generic, error_severity sev = error_severity::error) : std::runtime_error(msg.ToStdString()), message{msg}, file_path{fp}, severity{sev}, error_code{code} {
	}

	[[nodiscard]] error_severity get_severity() const noexcept {
		return severity;
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (file_path.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", file_path, message);
	}

	[[nodiscard]] review_error_code get_error_code() const noexcept {
		return error_code;
	}

private:
	wxString message;
	wxString file_path;
	error_severity severity;
	review_error_code error_code;
};

// Raised before any mutation; callers report it as a client error.
class corrupt_package_error : public review_exception {
public:
	explicit corrupt_package_error(const wxString& msg, review_error_code code = review_error_code::corrupt_package) : review_exception(msg, code) {
	}
};

// Post-condition failure after injection. The mutated bytes must never leave the session.
class roundtrip_invariant_violation : public review_exception {
public:
	explicit roundtrip_invariant_violation(const wxString& msg) : review_exception(msg, review_error_code::roundtrip_violation) {
	}
};
