/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * MobileLink HTTP bridge class
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include "RESTClient.hpp"
#include <utility>


/*
 * Request layer used by MobileLinkClient.
 *
 * SafeGET and SafePOST return false only if no HTTP response was received
 * (DNS, connect, TLS or timeout failures). In that case szResponse holds a
 * small json object {"code":"<curl code>","message":"<curl error>"}.
 * Otherwise szResponse holds the raw body and iHTTPCode the final status.
 *
 * The methods are virtual so a scripted transport can be substituted.
 */
class MobileLinkHTTPBridge : public RESTClient
{
public:
	MobileLinkHTTPBridge();
	virtual ~MobileLinkHTTPBridge();

	virtual bool SafeGET(const std::string &szUrl, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode);
	virtual bool SafePOST(const std::string &szUrl, const std::string &szPostdata, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode);

	static std::string URLEncode(const std::string &szDecodedString);
	static std::string FormEncode(const std::vector<std::pair<std::string, std::string> > &vFields);
	static bool ProcessResponse(std::string &szResponse, const std::vector<std::string> &vHeaderData, const bool bhttpOK);

	static void CloseConnection();
};

