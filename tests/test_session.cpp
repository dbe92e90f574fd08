/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Tests for credentials and session headers
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "mobilelink/session.hpp"
#include "mobilelinkclient/API.hpp"


static bool contains(const std::vector<std::string> &vHeaders, const std::string &szHeader)
{
	return std::find(vHeaders.begin(), vHeaders.end(), szHeader) != vHeaders.end();
}


TEST(SessionTest, TokenSessionIsLoggedInWithBearerHeader)
{
	mobilelink::session::state session = mobilelink::session::initial_state(mobilelink::auth::token("abc123"));
	EXPECT_EQ(mobilelink::auth::method::TOKEN, session.eAuthMethod);
	EXPECT_TRUE(session.bLoggedIn);
	EXPECT_EQ("Bearer abc123", session.mHeaders["Authorization"]);
	EXPECT_EQ(mobilelink::API::header::host, session.mHeaders["Host"]);
	EXPECT_EQ(mobilelink::API::header::appUserAgent, session.mHeaders["User-Agent"]);
	EXPECT_EQ(0U, session.mHeaders.count("Cookie"));
}

TEST(SessionTest, CookieSessionCarriesRawCookieHeader)
{
	mobilelink::session::state session = mobilelink::session::initial_state(mobilelink::auth::cookies("a=1; b=2"));
	EXPECT_EQ(mobilelink::auth::method::COOKIES, session.eAuthMethod);
	EXPECT_FALSE(session.bLoggedIn);
	EXPECT_EQ("a=1; b=2", session.mHeaders["Cookie"]);
	EXPECT_EQ(mobilelink::API::header::browserUserAgent, session.mHeaders["User-Agent"]);
	EXPECT_EQ(0U, session.mHeaders.count("Authorization"));
}

TEST(SessionTest, PasswordSessionStartsLoggedOut)
{
	mobilelink::session::state session = mobilelink::session::initial_state(mobilelink::auth::username_password("me@example.com", "secret"));
	EXPECT_EQ(mobilelink::auth::method::USERNAME_PASSWORD, session.eAuthMethod);
	EXPECT_FALSE(session.bLoggedIn);
	EXPECT_TRUE(session.szCsrfToken.empty());
	EXPECT_EQ(0U, session.mHeaders.count("Cookie"));
	EXPECT_EQ(0U, session.mHeaders.count("Authorization"));
}

TEST(SessionTest, CsrfHeaderOnlyWhenKnownAndRequested)
{
	mobilelink::session::state session = mobilelink::session::initial_state(mobilelink::auth::username_password("u", "p"));
	std::vector<std::string> vHeaders = mobilelink::session::request_headers(session);
	EXPECT_TRUE(contains(vHeaders, "Connection: keep-alive"));
	EXPECT_FALSE(contains(vHeaders, "X-Csrf-Token: tok"));

	session.szCsrfToken = "tok";
	vHeaders = mobilelink::session::request_headers(session);
	EXPECT_TRUE(contains(vHeaders, "X-Csrf-Token: tok"));

	vHeaders = mobilelink::session::request_headers(session, false);
	EXPECT_FALSE(contains(vHeaders, "X-Csrf-Token: tok"));
}
