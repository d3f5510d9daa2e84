/* main.cpp - command line front end.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include "findings_io.hpp"
#include "review_error.hpp"
#include "review_session.hpp"
#include "utils.hpp"
#include <cstdio>
#include <exception>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <wx/cmdline.h>
#include <wx/ffile.h>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/init.h>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
enum exit_code {
	exit_success = 0,
	exit_usage = 1,
	exit_invalid_package = 2,
	exit_failure = 3
};

// clang-format off
const wxCmdLineEntryDesc command_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_SWITCH, "v", "verbose", "log locator decisions"},
	{wxCMD_LINE_OPTION, "c", "config", "INI configuration file"},
	{wxCMD_LINE_OPTION, "f", "findings", "JSON findings file"},
	{wxCMD_LINE_OPTION, "o", "output", "annotated document to write"},
	{wxCMD_LINE_OPTION, "r", "report", "JSON report to write"},
	{wxCMD_LINE_OPTION, "m", "max-chars", "chapter character budget", wxCMD_LINE_VAL_NUMBER},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "command: verify, chapters, apply, geometry or check"},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "input document"},
	wxCMD_LINE_DESC_END,
};
// clang-format on

std::string read_file(const wxString& path) {
	wxFFile file(path, "rb");
	if (!file.IsOpened()) {
		throw review_exception(_("Cannot open file"), path);
	}
	const wxFileOffset length = file.Length();
	if (length < 0) {
		throw review_exception(_("Cannot determine file size"), path);
	}
	std::string data(static_cast<size_t>(length), '\0');
	if (length > 0 && file.Read(data.data(), data.size()) != data.size()) {
		throw review_exception(_("Failed to read file"), path);
	}
	return data;
}

// Writes beside the target first so a failed write never leaves a truncated file.
void write_file(const wxString& path, const std::string& data) {
	const wxString temp_path = path + ".tmp";
	{
		wxFFile file(temp_path, "wb");
		if (!file.IsOpened() || file.Write(data.data(), data.size()) != data.size() || !file.Close()) {
			wxRemoveFile(temp_path);
			throw review_exception(_("Failed to write file"), temp_path);
		}
	}
	if (!wxRenameFile(temp_path, path, true)) {
		wxRemoveFile(temp_path);
		throw review_exception(_("Failed to replace file"), path);
	}
}

void emit(const wxCmdLineParser& parser, const wxString& option, const std::string& json) {
	wxString path;
	if (parser.Found(option, &path)) {
		write_file(path, json + "\n");
	} else {
		wxPrintf("%s\n", wxString::FromUTF8(json));
	}
}

void configure_logging(const config_manager& config, bool verbose) {
	auto logger = spdlog::stderr_color_mt("marginalia");
	spdlog::set_default_logger(logger);
	spdlog::set_pattern("[%l] %v");
	auto level = spdlog::level::from_str(to_utf8(config.get(config_manager::log_level)));
	if (level == spdlog::level::off && config.get(config_manager::log_level) != "off") {
		level = spdlog::level::info;
	}
	spdlog::set_level(verbose ? spdlog::level::debug : level);
}

session_options make_session_options(const config_manager& config, const wxCmdLineParser& parser) {
	session_options options;
	options.locator = config.get_locator_options();
	options.segmenter = config.get_segmenter_options();
	options.injector = config.get_injector_options();
	options.priorities = config.get_agent_priority();
	options.max_chars = config.get_max_chars();
	options.max_findings = config.get_max_findings();
	options.max_package_bytes = config.get_max_package_bytes();
	options.workers = config.get_worker_count();
	long max_chars{0};
	if (parser.Found("max-chars", &max_chars)) {
		if (max_chars <= 0) {
			throw review_exception(_("--max-chars must be positive"));
		}
		options.max_chars = static_cast<size_t>(max_chars);
	}
	return options;
}

int run_command(const wxString& command, const wxString& input, const wxCmdLineParser& parser, const config_manager& config) {
	const review_session session(make_session_options(config, parser));
	const std::string bytes = read_file(input);
	if (command == "verify") {
		wxString reason;
		if (!session.verify(bytes, &reason)) {
			wxPrintf(_("%s: not a valid or supported document: %s\n"), input, reason);
			return exit_invalid_package;
		}
		wxPrintf(_("%s: ok\n"), input);
		return exit_success;
	}
	if (command == "chapters") {
		emit(parser, "report", chapters_to_json(session.locate_chapters(bytes)));
		return exit_success;
	}
	if (command == "geometry") {
		emit(parser, "report", geometry_to_json(session.read_page_geometry(bytes)));
		return exit_success;
	}
	wxString output;
	const bool has_output = parser.Found("output", &output);
	if (command == "check") {
		const auto result = session.check_format(bytes, config.get_profile(), config.get_max_font_findings());
		emit(parser, "report", geometry_to_json(result.geometry, result.checks));
		if (has_output) {
			const auto applied = session.apply_findings(bytes, result.font_findings);
			write_file(output, applied.bytes);
			if (!applied.succeeded) {
				return exit_failure;
			}
		} else if (!result.font_findings.empty()) {
			wxPrintf("%s\n", wxString::FromUTF8(findings_to_json(result.font_findings)));
		}
		return exit_success;
	}
	if (command == "apply") {
		wxString findings_path;
		if (!parser.Found("findings", &findings_path) || !has_output) {
			wxFprintf(stderr, _("apply needs --findings and --output\n"));
			return exit_usage;
		}
		const auto findings = parse_findings(read_file(findings_path));
		const auto result = session.apply_findings(bytes, findings);
		write_file(output, result.bytes);
		emit(parser, "report", report_to_json(result.report));
		return result.succeeded ? exit_success : exit_failure;
	}
	wxFprintf(stderr, _("Unknown command '%s'\n"), command);
	return exit_usage;
}
} // namespace

int main(int argc, char** argv) {
	wxInitializer initializer(argc, argv);
	if (!initializer.IsOk()) {
		fprintf(stderr, "Failed to initialize wxWidgets\n");
		return exit_failure;
	}
	wxCmdLineParser parser(command_line_desc, argc, argv);
	parser.SetLogo(wxString::Format("%s %s", APP_NAME, APP_VERSION));
	switch (parser.Parse()) {
		case -1:
			return exit_success;
		case 0:
			break;
		default:
			return exit_usage;
	}
	config_manager config;
	wxString config_path;
	if (parser.Found("config", &config_path) && !config.initialize(config_path)) {
		wxFprintf(stderr, _("Cannot read configuration %s\n"), config_path);
		return exit_usage;
	}
	configure_logging(config, parser.Found("verbose"));
	const wxString command = parser.GetParam(0);
	const wxString input = parser.GetParam(1);
	try {
		return run_command(command, input, parser, config);
	} catch (const corrupt_package_error& e) {
		spdlog::error("{}", to_utf8(e.get_display_message()));
		return exit_invalid_package;
	} catch (const review_exception& e) {
		spdlog::error("{}", to_utf8(e.get_display_message()));
		return e.get_error_code() == review_error_code::invalid_findings ? exit_usage : exit_failure;
	} catch (const std::exception& e) {
		spdlog::error("{}", e.what());
		return exit_failure;
	}
}
