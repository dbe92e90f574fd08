/************************************************************************
 *									*
 *	Time functions							*
 *									*
 ************************************************************************/
#pragma once
#include <ctime>
#include <string>


class IsoTimeString
{

public:

	static const std::string formatFraction;	// %Y-%m-%dT%H:%M:%S.%f%z
	static const std::string formatSeconds;		// %Y-%m-%dT%H:%M:%S%z


/*
 * Parse a server timestamp with fractional seconds or without and with a
 * mandatory UTC offset ('Z', +HH:MM, +HHMM or +HH). tUTC receives seconds
 * since epoch. On failure szError names the input and both formats.
 */
	static bool parse_timestamp(const std::string &szTimestamp, time_t &tUTC, std::string &szError);


/*
 * Format an epoch value as a localtime ISO datetime string
 */
	static std::string utc_to_local(const time_t tUTC);


private:
	static bool parse_format(const std::string &szTimestamp, const bool bFraction, time_t &tUTC);
	static long long days_from_civil(int year, const unsigned int month, const unsigned int day);
	static bool is_leap_year(const int year);

};
