/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Tests for the MobileLink HTTP bridge helpers
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include "connection/MobileLinkHTTPBridge.hpp"
#include "mobilelink/jsoncppbridge.hpp"


TEST(MobileLinkHTTPBridgeTest, URLEncodeKeepsUnreservedCharacters)
{
	EXPECT_EQ("abcXYZ019-_.~", MobileLinkHTTPBridge::URLEncode("abcXYZ019-_.~"));
	EXPECT_EQ("user%40example.com", MobileLinkHTTPBridge::URLEncode("user@example.com"));
	EXPECT_EQ("StateProperties%3DeyJUSUQ", MobileLinkHTTPBridge::URLEncode("StateProperties=eyJUSUQ"));
	EXPECT_EQ("a%20b%2Bc%26d", MobileLinkHTTPBridge::URLEncode("a b+c&d"));
}

TEST(MobileLinkHTTPBridgeTest, URLEncodeMultibyte)
{
	EXPECT_EQ("%C3%A9", MobileLinkHTTPBridge::URLEncode("\xC3\xA9"));
}

TEST(MobileLinkHTTPBridgeTest, FormEncodeKeepsFieldOrder)
{
	std::vector<std::pair<std::string, std::string> > vFields;
	vFields.push_back(std::make_pair("request_type", "RESPONSE"));
	vFields.push_back(std::make_pair("signInName", "me@example.com"));
	vFields.push_back(std::make_pair("password", "p&ss=word"));
	EXPECT_EQ("request_type=RESPONSE&signInName=me%40example.com&password=p%26ss%3Dword", MobileLinkHTTPBridge::FormEncode(vFields));
}

TEST(MobileLinkHTTPBridgeTest, ProcessResponseLeavesBodyOnSuccess)
{
	std::string szResponse = "{\"ok\":true}";
	std::vector<std::string> vHeaderData;
	EXPECT_TRUE(MobileLinkHTTPBridge::ProcessResponse(szResponse, vHeaderData, true));
	EXPECT_EQ("{\"ok\":true}", szResponse);
}

TEST(MobileLinkHTTPBridgeTest, ProcessResponseReportsCurlError)
{
	std::string szResponse = "partial";
	std::vector<std::string> vHeaderData;
	vHeaderData.push_back("HTTP/1.1 200 OK");
	vHeaderData.push_back("CURLE 7 Couldn't connect to \"server\"");
	EXPECT_FALSE(MobileLinkHTTPBridge::ProcessResponse(szResponse, vHeaderData, false));

	Json::Value jError;
	ASSERT_EQ(0, mobilelink::parse_json_string(szResponse, jError));
	EXPECT_EQ("7", jError["code"].asString());
	EXPECT_EQ("Couldn't connect to \"server\"", jError["message"].asString());
}

TEST(MobileLinkHTTPBridgeTest, ProcessResponseWithoutCurlDetails)
{
	std::string szResponse;
	std::vector<std::string> vHeaderData;
	EXPECT_FALSE(MobileLinkHTTPBridge::ProcessResponse(szResponse, vHeaderData, false));

	Json::Value jError;
	ASSERT_EQ(0, mobilelink::parse_json_string(szResponse, jError));
	EXPECT_EQ("-1", jError["code"].asString());
}

TEST(MobileLinkHTTPBridgeTest, UnsupportedSchemeIsReportedAsCurlError)
{
	MobileLinkHTTPBridge bridge;
	std::string szResponse;
	long iHTTPCode = -1;
	std::vector<std::string> vHeaders;
	EXPECT_FALSE(bridge.SafeGET("nosuchscheme://mobilelink.invalid/", vHeaders, szResponse, iHTTPCode));
	EXPECT_EQ(0, iHTTPCode);

	Json::Value jError;
	ASSERT_EQ(0, mobilelink::parse_json_string(szResponse, jError));
	EXPECT_EQ("1", jError["code"].asString());
	EXPECT_FALSE(jError["message"].asString().empty());
	MobileLinkHTTPBridge::CloseConnection();
}
