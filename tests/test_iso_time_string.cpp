/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Tests for server timestamp parsing
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <gtest/gtest.h>
#include <string>
#include "time/IsoTimeString.hpp"


TEST(IsoTimeStringTest, ParsesFractionalSecondsWithZulu)
{
	time_t tUTC = 0;
	std::string szError;
	ASSERT_TRUE(IsoTimeString::parse_timestamp("2024-01-15T10:30:00.123456Z", tUTC, szError));
	EXPECT_EQ(static_cast<time_t>(1705314600), tUTC);
	EXPECT_TRUE(szError.empty());
}

TEST(IsoTimeStringTest, ParsesWholeSecondsWithOffset)
{
	time_t tUTC = 0;
	std::string szError;
	ASSERT_TRUE(IsoTimeString::parse_timestamp("2024-01-15T12:30:00+02:00", tUTC, szError));
	EXPECT_EQ(static_cast<time_t>(1705314600), tUTC);

	ASSERT_TRUE(IsoTimeString::parse_timestamp("2024-01-15T05:30:00-0500", tUTC, szError));
	EXPECT_EQ(static_cast<time_t>(1705314600), tUTC);
}

TEST(IsoTimeStringTest, ShortFractionIsAccepted)
{
	time_t tUTC = 0;
	std::string szError;
	ASSERT_TRUE(IsoTimeString::parse_timestamp("2024-01-15T10:30:00.5+00:00", tUTC, szError));
	EXPECT_EQ(static_cast<time_t>(1705314600), tUTC);
}

TEST(IsoTimeStringTest, LeapDay)
{
	time_t tUTC = 0;
	std::string szError;
	ASSERT_TRUE(IsoTimeString::parse_timestamp("2024-02-29T23:59:59Z", tUTC, szError));
	EXPECT_EQ(static_cast<time_t>(1709251199), tUTC);
	EXPECT_FALSE(IsoTimeString::parse_timestamp("2023-02-29T23:59:59Z", tUTC, szError));
}

TEST(IsoTimeStringTest, ErrorNamesInputAndBothFormats)
{
	time_t tUTC = 0;
	std::string szError;
	ASSERT_FALSE(IsoTimeString::parse_timestamp("15/01/2024 10:30", tUTC, szError));
	EXPECT_NE(std::string::npos, szError.find("No known datetime format"));
	EXPECT_NE(std::string::npos, szError.find("'15/01/2024 10:30'"));
	EXPECT_NE(std::string::npos, szError.find(IsoTimeString::formatFraction));
	EXPECT_NE(std::string::npos, szError.find(IsoTimeString::formatSeconds));
}

TEST(IsoTimeStringTest, OffsetIsMandatory)
{
	time_t tUTC = 0;
	std::string szError;
	EXPECT_FALSE(IsoTimeString::parse_timestamp("2024-01-15T10:30:00", tUTC, szError));
	EXPECT_FALSE(IsoTimeString::parse_timestamp("2024-01-15T10:30:00.123", tUTC, szError));
	EXPECT_FALSE(IsoTimeString::parse_timestamp("", tUTC, szError));
}
