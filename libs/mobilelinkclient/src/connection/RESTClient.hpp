/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Base class for accessing web content
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>
#include <vector>

namespace connection {
  namespace HTTP {

    namespace method {
	enum value
	{
		GET		= 0x0001,
		POST		= 0x0002,
		HEAD		= 0x0010
	};
    }; // namespace method

  }; // namespace HTTP
}; // namespace connection




class RESTClient
{
protected:
	/************************************************************************
	 *									*
	 * cleanup function, should be called before application closes		*
	 *									*
	 ************************************************************************/

	static void Cleanup();


public:

	/************************************************************************
	 *									*
	 * Configuration functions						*
	 *									*
	 * CAUTION!								*
	 * Because these settings are global they affect every client in	*
	 * the process that uses RESTClient or a class that extends it.		*
	 *									*
	 ************************************************************************/

	static void SetConnectionTimeout(const long timeout);
	static void SetTimeout(const long timeout);
	static void SetUserAgent(const std::string &useragent);
	static void SetSecurityOptions(const bool verifypeer, const bool verifyhost);
	static void SetCookieFile(const std::string &cookiefile);

	static std::string GetCookieFile();


	/************************************************************************
	 *									*
	 * main method								*
	 *									*
	 * iHTTPCode receives the status of the last response in the		*
	 * redirect chain, or 0 if no response was received at all.		*
	 *									*
	 ************************************************************************/

	static bool Execute(const connection::HTTP::method::value eMethod, const std::string &szUrl, const std::string &szPostdata, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, std::vector<std::string> &vHeaderData, long &iHTTPCode, const bool bFollowRedirect = true, const long iTimeOut = -1);


	/************************************************************************
	 *									*
	 * non public								*
	 *									*
	 ************************************************************************/

private:
	static void SetGlobalOptions(void *curlobj);
	static bool CheckIfGlobalInitDone();

private:
	static bool m_bCurlGlobalInitialized;
	static bool m_bVerifyHost;
	static bool m_bVerifyPeer;
	static long m_iConnectionTimeout;
	static long m_iTimeout;
	static std::string m_sUserAgent;
	static std::string m_sCookieFile;
};

