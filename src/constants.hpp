/* constants.hpp - shared constants.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <wx/string.h>

inline const wxString APP_NAME = "Marginalia";
inline const wxString APP_VERSION = "0.3";

inline const char* WORDML_NS = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
inline const char* PACKAGE_REL_NS = "http://schemas.openxmlformats.org/package/2006/relationships";
inline const char* OFFICE_DOCUMENT_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
inline const char* STYLES_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
inline const char* THEME_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/theme";
inline const char* COMMENTS_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments";
inline const char* COMMENTS_CONTENT_TYPE = "application/vnd.openxmlformats-officedocument.wordprocessingml.comments+xml";

inline const char* CONTENT_TYPES_PART = "[Content_Types].xml";
inline const char* ROOT_RELS_PART = "_rels/.rels";
inline const char* DEFAULT_DOCUMENT_PART = "word/document.xml";

inline constexpr double TWIPS_PER_INCH = 1440.0;
inline constexpr double TOKENS_PER_WORD = 1.3;
inline constexpr size_t MIN_LITERAL_LENGTH = 2;
inline constexpr int MAX_HEADING_LEVEL = 9;
