/* config_manager.hpp - config management header file.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "chapter_segmenter.hpp"
#include "format_checker.hpp"
#include "overlap_resolver.hpp"
#include "run_injector.hpp"
#include "span_locator.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* section;
	const char* key;
	T default_value;

	constexpr app_setting(const char* s, const char* k, const T& def) : section{s}, key{k}, default_value{def} {
	}
};

class config_manager {
public:
	static constexpr app_setting<double> margin_left{"profile", "margin_left", 1.5};
	static constexpr app_setting<double> margin_right{"profile", "margin_right", 1.0};
	static constexpr app_setting<double> margin_top{"profile", "margin_top", 1.0};
	static constexpr app_setting<double> margin_bottom{"profile", "margin_bottom", 1.0};
	static inline const app_setting<wxString> font_family{"profile", "font_family", wxString("Times New Roman")};
	static constexpr app_setting<double> font_size{"profile", "font_size", 12.0};
	static constexpr app_setting<double> margin_tolerance{"profile", "margin_tolerance", 0.02};
	static constexpr app_setting<double> font_size_tolerance{"profile", "font_size_tolerance", 0.01};
	static constexpr app_setting<double> fuzzy_threshold{"matching", "fuzzy_threshold", 0.85};
	static constexpr app_setting<int> fuzzy_max_literal{"matching", "fuzzy_max_literal", 400};
	static constexpr app_setting<int> locator_workers{"matching", "workers", 4};
	static constexpr app_setting<int> max_chars{"segmenter", "max_chars", 16000};
	static constexpr app_setting<int> chapter_heading_level{"segmenter", "chapter_heading_level", 1};
	static inline const app_setting<wxString> heading_pattern{"segmenter", "heading_pattern", wxString(R"(^\s*(Chapter|CHAPTER)\s+(\d+|[IVXLC]+)\b)")};
	static inline const app_setting<wxString> major_color{"annotate", "major_color", wxString("red")};
	static inline const app_setting<wxString> minor_color{"annotate", "minor_color", wxString("yellow")};
	static constexpr app_setting<bool> add_comments{"annotate", "comments", true};
	static inline const app_setting<wxString> comment_author{"annotate", "comment_author", wxString("Marginalia")};
	static inline const app_setting<wxString> comment_initials{"annotate", "comment_initials", wxString("MG")};
	static constexpr app_setting<int> max_findings{"annotate", "max_findings", 10000};
	static constexpr app_setting<int> max_font_findings{"annotate", "max_font_findings", 50};
	static constexpr app_setting<int> max_package_mb{"package", "max_size_mb", 50};
	static inline const app_setting<wxString> log_level{"logging", "level", wxString("info")};

	config_manager() = default;
	~config_manager() = default;
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;

	// A path that does not exist yet yields defaults.
	bool initialize(const wxString& config_path);
	bool load_from_string(const wxString& ini);

	[[nodiscard]] bool is_initialized() const {
		return config != nullptr;
	}

	template <typename T>
	T get(const app_setting<T>& setting) const {
		return get_app_setting(wxString(setting.section), wxString(setting.key), setting.default_value);
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		set_app_setting(wxString(setting.section), wxString(setting.key), value);
	}

	[[nodiscard]] review_profile get_profile() const;
	[[nodiscard]] locator_options get_locator_options() const;
	[[nodiscard]] segmenter_options get_segmenter_options() const;
	[[nodiscard]] injector_options get_injector_options() const;
	[[nodiscard]] agent_priority get_agent_priority() const;
	[[nodiscard]] size_t get_max_chars() const;
	[[nodiscard]] size_t get_max_findings() const;
	[[nodiscard]] size_t get_max_font_findings() const;
	[[nodiscard]] size_t get_max_package_bytes() const;
	[[nodiscard]] size_t get_worker_count() const;

private:
	std::unique_ptr<wxFileConfig> config;

	template <typename T>
	T get_app_setting(const wxString& section, const wxString& key, const T& default_value) const;
	template <typename T>
	void set_app_setting(const wxString& section, const wxString& key, const T& value);
	void with_section(const wxString& section, const std::function<void()>& func) const;
	[[nodiscard]] size_t get_positive(const app_setting<int>& setting) const;
};
