/* findings_io.hpp - header file for JSON input and output of review records.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "chapter_segmenter.hpp"
#include "finding.hpp"
#include "format_checker.hpp"
#include "geometry_reader.hpp"
#include "review_report.hpp"
#include <string>
#include <vector>

// Accepts a bare array of findings or an object holding one under "findings" or "issues".
// Throws review_exception with review_error_code::invalid_findings on malformed input.
[[nodiscard]] std::vector<finding> parse_findings(const std::string& json_text);
[[nodiscard]] std::string findings_to_json(const std::vector<finding>& findings);
[[nodiscard]] std::string report_to_json(const review_report& report);
[[nodiscard]] std::string chapters_to_json(const std::vector<chapter>& chapters);
[[nodiscard]] std::string geometry_to_json(const page_geometry& geometry, const std::vector<geometry_check>& checks = {});
