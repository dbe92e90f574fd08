/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * MobileLink HTTP bridge class
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "MobileLinkHTTPBridge.hpp"
#include <sstream>
#include <iomanip>

namespace mobilelink {
  namespace API {
    namespace method {
	enum value {
		GET	= (connection::HTTP::method::HEAD | connection::HTTP::method::GET),
		POST	= (connection::HTTP::method::HEAD | connection::HTTP::method::POST)
	};
    }; // namespace method
  }; // namespace API
}; // namespace mobilelink


MobileLinkHTTPBridge::MobileLinkHTTPBridge()
{
}


MobileLinkHTTPBridge::~MobileLinkHTTPBridge()
{
}


bool MobileLinkHTTPBridge::SafeGET(const std::string &szUrl, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode)
{
	std::vector<std::string> vHeaderData;
	bool bhttpOK = Execute((connection::HTTP::method::value)mobilelink::API::method::GET, szUrl, "", vExtraHeaders, szResponse, vHeaderData, iHTTPCode, true);
	return ProcessResponse(szResponse, vHeaderData, bhttpOK);
}

bool MobileLinkHTTPBridge::SafePOST(const std::string &szUrl, const std::string &szPostdata, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode)
{
	std::vector<std::string> vHeaderData;
	bool bhttpOK = Execute((connection::HTTP::method::value)mobilelink::API::method::POST, szUrl, szPostdata, vExtraHeaders, szResponse, vHeaderData, iHTTPCode, true);
	return ProcessResponse(szResponse, vHeaderData, bhttpOK);
}

std::string MobileLinkHTTPBridge::URLEncode(const std::string &szDecodedString)
{
	char c;
	unsigned int i;
	std::stringstream ss;
	for (i=0; i < (unsigned int)szDecodedString.length(); i++)
	{
		c = szDecodedString[i];
		if (c == '-' || c == '_' || c == '.' || c == '~')
		{
			ss << c;
			continue;
		}
		if ( (c >= 0x30) && (c < 0x3A) )
		{
			ss << c;
			continue;
		}
		if ( ((c|0x20) > 0x60) && ((c|0x20) < 0x7b) )
		{
			ss << c;
			continue;
		}
		ss  << '%' << std::hex << std::uppercase << std::setfill('0') << std::setw(2) << int((unsigned char) c) << std::nouppercase << std::dec;
	}
	return ss.str();
}

std::string MobileLinkHTTPBridge::FormEncode(const std::vector<std::pair<std::string, std::string> > &vFields)
{
	std::string szFormdata;
	std::vector<std::pair<std::string, std::string> >::const_iterator itt;
	for (itt = vFields.begin(); itt != vFields.end(); ++itt)
	{
		if (!szFormdata.empty())
			szFormdata.append("&");
		szFormdata.append(URLEncode(itt->first));
		szFormdata.append("=");
		szFormdata.append(URLEncode(itt->second));
	}
	return szFormdata;
}

bool MobileLinkHTTPBridge::ProcessResponse(std::string &szResponse, const std::vector<std::string> &vHeaderData, const bool bhttpOK)
{
	if (bhttpOK)
		return true;

	// use Curl error data to create a response
	std::string szCode = "-1";
	std::string szMessage = "HTTP client error";
	std::vector<std::string>::const_reverse_iterator itt;
	for (itt = vHeaderData.rbegin(); itt != vHeaderData.rend(); ++itt)
	{
		if ((*itt).compare(0, 6, "CURLE ") != 0)
			continue;
		size_t pos = (*itt).find(' ', 6);
		if (pos != std::string::npos)
		{
			szCode = (*itt).substr(6, pos - 6);
			szMessage = (*itt).substr(pos + 1);
		}
		break;
	}

	std::string szEscaped;
	for (size_t i = 0; i < szMessage.size(); i++)
	{
		if ((szMessage[i] == '"') || (szMessage[i] == '\\'))
			szEscaped.append(1, '\\');
		szEscaped.append(1, szMessage[i]);
	}

	szResponse = "{\"code\":\"";
	szResponse.append(szCode);
	szResponse.append("\",\"message\":\"");
	szResponse.append(szEscaped);
	szResponse.append("\"}");
	return false;
}

void MobileLinkHTTPBridge::CloseConnection()
{
	MobileLinkHTTPBridge::Cleanup();
}

