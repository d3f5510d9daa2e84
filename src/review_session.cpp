/* review_session.cpp - orchestration of verification, chapter location, annotation and geometry.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "review_session.hpp"
#include "docx_loader.hpp"
#include "utils.hpp"
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>
#include <wx/string.h>
#include <wx/translation.h>

review_session::review_session(session_options opts) : options{std::move(opts)}, guard{options.max_package_bytes} {
}

bool review_session::verify(const std::string& bytes, wxString* reason) const {
	return guard.verify(bytes, reason);
}

std::unique_ptr<document> review_session::open(const std::string& bytes) const {
	wxString reason;
	if (!guard.verify(bytes, &reason)) {
		throw corrupt_package_error(wxString::Format(_("Not a valid or supported document: %s"), reason));
	}
	return docx_loader::load(bytes);
}

std::vector<chapter> review_session::locate_chapters(const std::string& bytes) const {
	const auto doc = open(bytes);
	auto chapters = chapter_segmenter(options.segmenter).segment(*doc, options.max_chars);
	spdlog::info("Segmented {} paragraphs into {} chapters", doc->paragraphs.size(), chapters.size());
	return chapters;
}

page_geometry review_session::read_page_geometry(const std::string& bytes) const {
	const auto doc = open(bytes);
	return geometry_reader::read(*doc);
}

check_result review_session::check_format(const std::string& bytes, const review_profile& profile, size_t max_font_findings) const {
	const auto doc = open(bytes);
	check_result result;
	result.geometry = geometry_reader::read(*doc);
	result.checks = compare_geometry(result.geometry, profile);
	result.font_findings = check_run_fonts(*doc, profile, max_font_findings);
	spdlog::info("Format check: {} geometry deviations, {} font findings", std::ranges::count_if(result.checks, [](const geometry_check& c) {
		return !c.passed;
	}),
		result.font_findings.size());
	return result;
}

std::vector<locate_result> review_session::locate_all(const span_locator& locator, const std::vector<finding>& findings, size_t count, const std::atomic<bool>* cancel) const {
	std::vector<locate_result> results(count);
	const size_t workers = std::max<size_t>(1, std::min(options.workers, count));
	std::vector<std::future<void>> tasks;
	tasks.reserve(workers);
	for (size_t w = 0; w < workers; ++w) {
		tasks.push_back(std::async(std::launch::async, [&, w]() {
			for (size_t i = w; i < count; i += workers) {
				if (cancel != nullptr && cancel->load()) {
					return;
				}
				results[i] = locator.locate(findings[i]);
				spdlog::debug("Finding {}: {} ({} spans, score {:.3f})", i, match_kind_name(results[i].kind), results[i].spans.size(), results[i].score);
			}
		}));
	}
	// Barrier. get() rethrows the first failure once every task has finished.
	for (auto& task : tasks) {
		task.wait();
	}
	for (auto& task : tasks) {
		task.get();
	}
	return results;
}

void review_session::record_locations(const std::vector<finding>& findings, const std::vector<locate_result>& results, size_t count, review_report& report) const {
	for (size_t i = 0; i < count; ++i) {
		const auto& result = results[i];
		const wxString literal = wxString::FromUTF8(findings[i].literal_text).Left(60);
		switch (result.status) {
			case locate_status::found:
				++report.findings_located;
				if (result.kind == match_kind::exact) {
					++report.exact_matches;
				} else if (result.kind == match_kind::normalized) {
					++report.normalized_matches;
				} else {
					++report.fuzzy_matches;
				}
				break;
			case locate_status::too_short:
				++report.skipped;
				report.add(report_kind::literal_too_short, i, to_utf8(wxString::Format(_("Finding %zu has no usable literal text"), i)));
				break;
			case locate_status::unknown_chapter:
				++report.not_found;
				report.add(report_kind::unknown_chapter, i, to_utf8(wxString::Format(_("Finding %zu refers to chapter %d, which does not exist"), i, findings[i].hint.chapter_id.value_or(0))));
				break;
			case locate_status::not_found:
				++report.not_found;
				report.add(report_kind::span_not_found, i, to_utf8(wxString::Format(_("Finding %zu text not found: \"%s\" (best score %.2f)"), i, literal, result.score)));
				break;
		}
	}
}

apply_result review_session::apply_findings(const std::string& bytes, const std::vector<finding>& findings, const std::atomic<bool>* cancel) const {
	apply_result result;
	result.bytes = bytes;
	auto doc = open(bytes);
	auto& report = result.report;
	report.findings_received = findings.size();
	const size_t count = std::min(findings.size(), options.max_findings);
	report.findings_processed = count;
	if (count < findings.size()) {
		report.skipped += findings.size() - count;
		report.add(report_kind::finding_limit, count, to_utf8(wxString::Format(_("Only the first %zu of %zu findings were processed"), count, findings.size())));
	}

	const text_index whole = flatten(*doc);
	const auto chapters = chapter_segmenter(options.segmenter).segment(*doc, options.max_chars);
	std::vector<locate_result> located;
	{
		const span_locator locator(*doc, whole, chapters, options.locator);
		located = locate_all(locator, findings, count, cancel);
	}
	if (cancel != nullptr && cancel->load()) {
		report.cancelled = true;
		result.succeeded = false;
		result.error = _("Review cancelled before any edit was made");
		spdlog::warn("{}", to_utf8(result.error));
		return result;
	}
	record_locations(findings, located, count, report);

	const edit_plan plan = overlap_resolver(options.priorities).resolve(findings, located);
	for (const auto& conflict : plan.conflicts) {
		report.add(report_kind::overlap_conflict, conflict.loser, to_utf8(wxString::Format(_("Finding %zu overrides finding %zu in paragraph %zu, run %zu (%zu characters)"), conflict.winner, conflict.loser, conflict.paragraph_index, conflict.run_index, conflict.length)));
	}

	// From here on the document is mutated; any failure hands back the input bytes.
	try {
		const auto summary = run_injector(options.injector).apply(*doc, plan);
		std::string edited = doc->to_bytes();
		if (!plan.empty()) {
			integrity_guard::verify_roundtrip(bytes, edited);
			wxString reason;
			if (!guard.verify(edited, &reason)) {
				throw roundtrip_invariant_violation(wxString::Format(_("Edited package failed verification: %s"), reason));
			}
		}
		report.spans_applied = plan.entries.size();
		report.runs_split = summary.runs_split;
		report.comments_added = summary.comments_added;
		result.bytes = std::move(edited);
	} catch (const review_exception& e) {
		spdlog::error("Annotation failed, returning the original document: {}", to_utf8(e.get_display_message()));
		result.succeeded = false;
		result.error = e.get_display_message();
		result.error_code = e.get_error_code();
		return result;
	} catch (const std::exception& e) {
		spdlog::error("Annotation failed, returning the original document: {}", e.what());
		result.succeeded = false;
		result.error = wxString::FromUTF8(e.what());
		return result;
	}
	spdlog::info("Applied {} highlights and {} comments for {} of {} findings ({} not found, {} skipped)", report.spans_applied, report.comments_added, report.findings_located, report.findings_received, report.not_found, report.skipped);
	return result;
}
