/* config_manager.cpp - manages reading from and writing to our INI-based config file.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <wx/filename.h>
#include <wx/sstream.h>
#include <wx/string.h>

namespace {
inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

inline double read_config_value(wxFileConfig* cfg, const wxString& key, double default_val) {
	return cfg->ReadDouble(key, default_val);
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}
} // namespace

bool config_manager::initialize(const wxString& config_path) {
	wxFileName file(config_path);
	file.MakeAbsolute();
	if (!file.FileExists()) {
		spdlog::info("No configuration at {}, using defaults", to_utf8(file.GetFullPath()));
	}
	config = std::make_unique<wxFileConfig>(APP_NAME, "", file.GetFullPath(), "", wxCONFIG_USE_LOCAL_FILE);
	return config != nullptr;
}

bool config_manager::load_from_string(const wxString& ini) {
	wxStringInputStream stream(ini);
	config = std::make_unique<wxFileConfig>(stream);
	return config != nullptr;
}

template <typename T>
T config_manager::get_app_setting(const wxString& section, const wxString& key, const T& default_value) const {
	T result = default_value;
	with_section(section, [this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& section, const wxString& key, const T& value) {
	if (!config) {
		config = std::make_unique<wxFileConfig>(APP_NAME, "", "", "", 0);
	}
	with_section(section, [this, &key, &value]() {
		config->Write(key, value);
	});
}

void config_manager::with_section(const wxString& section, const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath("/" + section);
	func();
	config->SetPath("/");
}

size_t config_manager::get_positive(const app_setting<int>& setting) const {
	const int value = get(setting);
	if (value <= 0) {
		spdlog::warn("[{}] {} must be positive, using {}", setting.section, setting.key, setting.default_value);
		return static_cast<size_t>(setting.default_value);
	}
	return static_cast<size_t>(value);
}

review_profile config_manager::get_profile() const {
	review_profile profile;
	profile.margins.left = get(margin_left);
	profile.margins.right = get(margin_right);
	profile.margins.top = get(margin_top);
	profile.margins.bottom = get(margin_bottom);
	profile.font_family = to_utf8(get(font_family));
	profile.font_size = get(font_size);
	profile.margin_tolerance = get(margin_tolerance);
	profile.font_size_tolerance = get(font_size_tolerance);
	return profile;
}

locator_options config_manager::get_locator_options() const {
	locator_options options;
	const double threshold = get(fuzzy_threshold);
	if (threshold <= 0.0 || threshold > 1.0) {
		spdlog::warn("[matching] fuzzy_threshold {} is outside (0, 1], using {}", threshold, fuzzy_threshold.default_value);
	} else {
		options.fuzzy_threshold = threshold;
	}
	options.fuzzy_max_literal = get_positive(fuzzy_max_literal);
	return options;
}

segmenter_options config_manager::get_segmenter_options() const {
	segmenter_options options;
	const int level = get(chapter_heading_level);
	options.chapter_heading_level = level >= 0 && level <= MAX_HEADING_LEVEL ? level : chapter_heading_level.default_value;
	options.heading_pattern = to_utf8(get(heading_pattern));
	return options;
}

injector_options config_manager::get_injector_options() const {
	injector_options options;
	options.major_color = to_utf8(get(major_color));
	options.minor_color = to_utf8(get(minor_color));
	options.add_comments = get(add_comments);
	options.comment_author = to_utf8(get(comment_author));
	options.comment_initials = to_utf8(get(comment_initials));
	return options;
}

agent_priority config_manager::get_agent_priority() const {
	auto tiers = agent_priority().entries();
	with_section("agents", [this, &tiers]() {
		wxString name;
		long cookie{0};
		bool more = config->GetFirstEntry(name, cookie);
		while (more) {
			const std::string value = to_utf8(config->Read(name, wxString()).Lower().Trim().Trim(false));
			const auto tier = agent_tier_from_string(value);
			if (tier) {
				tiers[to_utf8(name)] = *tier;
			} else {
				spdlog::warn("[agents] {} has unknown tier '{}'", to_utf8(name), value);
			}
			more = config->GetNextEntry(name, cookie);
		}
	});
	return agent_priority(std::move(tiers));
}

size_t config_manager::get_max_chars() const {
	return get_positive(max_chars);
}

size_t config_manager::get_max_findings() const {
	return get_positive(max_findings);
}

size_t config_manager::get_max_font_findings() const {
	const int value = get(max_font_findings);
	return value < 0 ? 0 : static_cast<size_t>(value);
}

size_t config_manager::get_max_package_bytes() const {
	return get_positive(max_package_mb) * 1024 * 1024;
}

size_t config_manager::get_worker_count() const {
	return get_positive(locator_workers);
}

template bool config_manager::get_app_setting<bool>(const wxString&, const wxString&, const bool&) const;
template int config_manager::get_app_setting<int>(const wxString&, const wxString&, const int&) const;
template double config_manager::get_app_setting<double>(const wxString&, const wxString&, const double&) const;
template wxString config_manager::get_app_setting<wxString>(const wxString&, const wxString&, const wxString&) const;
template void config_manager::set_app_setting<bool>(const wxString&, const wxString&, const bool&);
template void config_manager::set_app_setting<int>(const wxString&, const wxString&, const int&);
template void config_manager::set_app_setting<double>(const wxString&, const wxString&, const double&);
template void config_manager::set_app_setting<wxString>(const wxString&, const wxString&, const wxString&);
