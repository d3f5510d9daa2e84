/* config_manager_test.cpp - tests for configuration loading.
 *
 * Marginalia.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include <gtest/gtest.h>
#include <wx/string.h>

TEST(config_manager_test, uninitialized_config_yields_defaults) {
	const config_manager config;
	EXPECT_FALSE(config.is_initialized());
	const auto profile = config.get_profile();
	EXPECT_DOUBLE_EQ(profile.margins.left, 1.5);
	EXPECT_DOUBLE_EQ(profile.margins.right, 1.0);
	EXPECT_EQ(profile.font_family, "Times New Roman");
	EXPECT_DOUBLE_EQ(profile.font_size, 12.0);
	EXPECT_DOUBLE_EQ(config.get_locator_options().fuzzy_threshold, 0.85);
	EXPECT_EQ(config.get_max_chars(), 16000u);
	EXPECT_EQ(config.get_max_package_bytes(), 50u * 1024 * 1024);
	EXPECT_EQ(config.get_injector_options().major_color, "red");
	EXPECT_TRUE(config.get_injector_options().add_comments);
	EXPECT_EQ(config.get_agent_priority().tier_of("chairman"), agent_tier::synthesis);
}

TEST(config_manager_test, reads_values_from_ini) {
	config_manager config;
	ASSERT_TRUE(config.load_from_string(
		"[profile]\n"
		"margin_left=1.25\n"
		"font_family=Arial\n"
		"font_size=11\n"
		"[segmenter]\n"
		"max_chars=500\n"
		"[annotate]\n"
		"major_color=magenta\n"
		"comments=0\n"
		"comment_author=Editorial Desk\n"
		"[matching]\n"
		"fuzzy_threshold=0.9\n"
		"workers=2\n"));
	const auto profile = config.get_profile();
	EXPECT_DOUBLE_EQ(profile.margins.left, 1.25);
	EXPECT_DOUBLE_EQ(profile.margins.top, 1.0);
	EXPECT_EQ(profile.font_family, "Arial");
	EXPECT_DOUBLE_EQ(profile.font_size, 11.0);
	EXPECT_EQ(config.get_max_chars(), 500u);
	const auto injector = config.get_injector_options();
	EXPECT_EQ(injector.major_color, "magenta");
	EXPECT_EQ(injector.minor_color, "yellow");
	EXPECT_FALSE(injector.add_comments);
	EXPECT_EQ(injector.comment_author, "Editorial Desk");
	EXPECT_DOUBLE_EQ(config.get_locator_options().fuzzy_threshold, 0.9);
	EXPECT_EQ(config.get_worker_count(), 2u);
}

TEST(config_manager_test, agents_section_overrides_tiers) {
	config_manager config;
	ASSERT_TRUE(config.load_from_string("[agents]\ngrammar=synthesis\nreviewer=deep\nbroken=sometimes\n"));
	const auto priority = config.get_agent_priority();
	EXPECT_EQ(priority.tier_of("grammar"), agent_tier::synthesis);
	EXPECT_EQ(priority.tier_of("reviewer"), agent_tier::deep);
	EXPECT_EQ(priority.tier_of("tech"), agent_tier::rule);
	EXPECT_EQ(priority.tier_of("broken"), agent_tier::unknown);
}

TEST(config_manager_test, invalid_values_fall_back_to_defaults) {
	config_manager config;
	ASSERT_TRUE(config.load_from_string("[matching]\nfuzzy_threshold=1.5\nfuzzy_max_literal=-3\n[segmenter]\nmax_chars=0\nchapter_heading_level=12\n"));
	const auto locator = config.get_locator_options();
	EXPECT_DOUBLE_EQ(locator.fuzzy_threshold, 0.85);
	EXPECT_EQ(locator.fuzzy_max_literal, 400u);
	EXPECT_EQ(config.get_max_chars(), 16000u);
	EXPECT_EQ(config.get_segmenter_options().chapter_heading_level, 1);
}

TEST(config_manager_test, set_then_get) {
	config_manager config;
	config.set(config_manager::max_findings, 25);
	config.set(config_manager::font_family, wxString("Georgia"));
	EXPECT_EQ(config.get_max_findings(), 25u);
	EXPECT_EQ(config.get_profile().font_family, "Georgia");
}
