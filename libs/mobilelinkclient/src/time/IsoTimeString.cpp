/************************************************************************
 *									*
 *	Time functions							*
 *									*
 ************************************************************************/


#include "IsoTimeString.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>


#ifdef _WIN32
#define localtime_r(timep, result) localtime_s(result, timep)
#endif


const std::string IsoTimeString::formatFraction = "%Y-%m-%dT%H:%M:%S.%f%z";
const std::string IsoTimeString::formatSeconds = "%Y-%m-%dT%H:%M:%S%z";


/* private */ bool IsoTimeString::is_leap_year(const int year)
{
	return (((year % 4) == 0) && ((year % 100) != 0)) || ((year % 400) == 0);
}


/*
 * Number of days between 1970-01-01 and the given proleptic Gregorian date
 */
/* private */ long long IsoTimeString::days_from_civil(int year, const unsigned int month, const unsigned int day)
{
	year -= (month <= 2) ? 1 : 0;
	const long long era = (year >= 0 ? year : year - 399) / 400;
	const unsigned int yoe = static_cast<unsigned int>(year - era * 400);
	const unsigned int doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
	const unsigned int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<long long>(doe) - 719468;
}


static bool read_digits(const std::string &szInput, size_t &pos, const size_t count, int &value)
{
	if (pos + count > szInput.size())
		return false;
	value = 0;
	for (size_t i = 0; i < count; i++)
	{
		char c = szInput[pos + i];
		if ((c < '0') || (c > '9'))
			return false;
		value = value * 10 + (c - '0');
	}
	pos += count;
	return true;
}


static bool read_char(const std::string &szInput, size_t &pos, const char expected)
{
	if ((pos >= szInput.size()) || (szInput[pos] != expected))
		return false;
	pos++;
	return true;
}


/* private */ bool IsoTimeString::parse_format(const std::string &szTimestamp, const bool bFraction, time_t &tUTC)
{
	static const int monthdays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

	size_t pos = 0;
	int year, month, day, hour, minute, second;
	if (!read_digits(szTimestamp, pos, 4, year) || !read_char(szTimestamp, pos, '-') ||
	    !read_digits(szTimestamp, pos, 2, month) || !read_char(szTimestamp, pos, '-') ||
	    !read_digits(szTimestamp, pos, 2, day) || !read_char(szTimestamp, pos, 'T') ||
	    !read_digits(szTimestamp, pos, 2, hour) || !read_char(szTimestamp, pos, ':') ||
	    !read_digits(szTimestamp, pos, 2, minute) || !read_char(szTimestamp, pos, ':') ||
	    !read_digits(szTimestamp, pos, 2, second))
		return false;

	if (bFraction)
	{
		if (!read_char(szTimestamp, pos, '.'))
			return false;
		size_t fractionstart = pos;
		while ((pos < szTimestamp.size()) && (szTimestamp[pos] >= '0') && (szTimestamp[pos] <= '9') && (pos - fractionstart < 6))
			pos++;
		if (pos == fractionstart)
			return false;
	}

	// utc offset
	int offset = 0;
	if (pos >= szTimestamp.size())
		return false;
	if ((szTimestamp[pos] == 'Z') || (szTimestamp[pos] == 'z'))
		pos++;
	else if ((szTimestamp[pos] == '+') || (szTimestamp[pos] == '-'))
	{
		int sign = (szTimestamp[pos] == '-') ? -1 : 1;
		pos++;
		int offsethours, offsetminutes = 0;
		if (!read_digits(szTimestamp, pos, 2, offsethours))
			return false;
		if (pos < szTimestamp.size())
		{
			if (szTimestamp[pos] == ':')
				pos++;
			if (!read_digits(szTimestamp, pos, 2, offsetminutes))
				return false;
		}
		if ((offsethours > 23) || (offsetminutes > 59))
			return false;
		offset = sign * (offsethours * 3600 + offsetminutes * 60);
	}
	else
		return false;

	if (pos != szTimestamp.size())
		return false;

	if ((month < 1) || (month > 12) || (day < 1))
		return false;
	int maxday = monthdays[month - 1];
	if ((month == 2) && is_leap_year(year))
		maxday = 29;
	if ((day > maxday) || (hour > 23) || (minute > 59) || (second > 59))
		return false;

	long long days = days_from_civil(year, static_cast<unsigned int>(month), static_cast<unsigned int>(day));
	long long seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset;
	tUTC = static_cast<time_t>(seconds);
	return true;
}


bool IsoTimeString::parse_timestamp(const std::string &szTimestamp, time_t &tUTC, std::string &szError)
{
	if (parse_format(szTimestamp, true, tUTC))
		return true;
	if (parse_format(szTimestamp, false, tUTC))
		return true;

	szError = "No known datetime format for raw string '";
	szError.append(szTimestamp);
	szError.append("' (tried ");
	szError.append(formatFraction);
	szError.append(" and ");
	szError.append(formatSeconds);
	szError.append(")");
	return false;
}


std::string IsoTimeString::utc_to_local(const time_t tUTC)
{
	struct tm ltime;
	localtime_r(&tUTC, &ltime);
	char cLocal[40];
	snprintf(cLocal, sizeof(cLocal), "%04d-%02d-%02dT%02d:%02d:%02d", ltime.tm_year+1900, ltime.tm_mon+1, ltime.tm_mday, ltime.tm_hour, ltime.tm_min, ltime.tm_sec);
	return std::string(cLocal);
}

