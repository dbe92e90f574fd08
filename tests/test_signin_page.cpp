/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Tests for scraping the MobileLink sign-in pages
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <gtest/gtest.h>
#include <map>
#include <string>
#include "mobilelink/signinpage.hpp"


TEST(SignInPageTest, ExtractsSettingsLine)
{
	std::string szPage =
		"<html><head>\r\n"
		"<script>\r\n"
		"var SETTINGS = {\"csrf\":\"abc\",\"transId\":\"T1\"};\r\n"
		"</script>\r\n";
	std::string szJson;
	ASSERT_TRUE(mobilelink::html::extract_settings_json(szPage, szJson));
	EXPECT_EQ("{\"csrf\":\"abc\",\"transId\":\"T1\"}", szJson);
}

TEST(SignInPageTest, SettingsLineMustStartWithPrefix)
{
	std::string szJson;
	EXPECT_FALSE(mobilelink::html::extract_settings_json("  var SETTINGS = {\"csrf\":\"abc\"};\n", szJson));
	EXPECT_FALSE(mobilelink::html::extract_settings_json("var SETTINGS = {\"csrf\":\"abc\"}\n", szJson));
	EXPECT_FALSE(mobilelink::html::extract_settings_json("<html></html>", szJson));
}

TEST(SignInPageTest, ExtractsFinalForm)
{
	std::string szPage =
		"<html><body onload=\"document.forms[0].submit()\">"
		"<form id=\"auto\" method=\"post\" action=\"https://app.mobilelinkgen.com/signin-oidc?x=1&amp;y=2\">"
		"<input type=\"hidden\" name=\"state\" value=\"S&amp;1\" />"
		"<input type='hidden' name='code' value='C1'>"
		"</form></body></html>";
	mobilelink::html::finalForm form;
	ASSERT_TRUE(mobilelink::html::extract_final_form(szPage, form));
	EXPECT_EQ("https://app.mobilelinkgen.com/signin-oidc?x=1&y=2", form.szAction);
	EXPECT_EQ("S&1", form.szState);
	EXPECT_EQ("C1", form.szCode);
}

TEST(SignInPageTest, FinalFormNeedsStateAndCode)
{
	mobilelink::html::finalForm form;
	EXPECT_FALSE(mobilelink::html::extract_final_form("<form action=\"/x\"><input name=\"state\" value=\"S\"></form>", form));
	EXPECT_FALSE(mobilelink::html::extract_final_form("<form action=\"/x\"><input name=\"state\" value=\"S\"><input name=\"code\"></form>", form));
	EXPECT_FALSE(mobilelink::html::extract_final_form("<input name=\"state\" value=\"S\"><input name=\"code\" value=\"C\">", form));
	EXPECT_FALSE(mobilelink::html::extract_final_form("<form><input name=\"state\" value=\"S\"><input name=\"code\" value=\"C\"></form>", form));
}

TEST(SignInPageTest, IgnoresMarkupInCommentsAndScripts)
{
	std::string szPage =
		"<!-- <form action=\"/comment\"> -->"
		"<script>var s = '<form action=\"/script\">';</script>"
		"<form action=\"/real\">"
		"<input name=\"state\" value=\"S\"><input name=\"code\" value=\"C\">"
		"</form>";
	mobilelink::html::finalForm form;
	ASSERT_TRUE(mobilelink::html::extract_final_form(szPage, form));
	EXPECT_EQ("/real", form.szAction);
}

TEST(SignInPageTest, TagAttributes)
{
	std::map<std::string, std::string> mAttributes = mobilelink::html::get_tag_attributes("<INPUT Name=code VALUE=\"a&quot;b\" disabled value=\"second\">");
	EXPECT_EQ("code", mAttributes["name"]);
	EXPECT_EQ("a\"b", mAttributes["value"]);
	EXPECT_EQ(1U, mAttributes.count("disabled"));
}

TEST(SignInPageTest, DecodeEntities)
{
	EXPECT_EQ("<a & b>", mobilelink::html::decode_entities("&lt;a &amp; b&gt;"));
	EXPECT_EQ("A\xC3\xA9", mobilelink::html::decode_entities("&#65;&#xE9;"));
	EXPECT_EQ("&unknown; & x", mobilelink::html::decode_entities("&unknown; & x"));
}
