/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Scripted transport for the MobileLink client tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <deque>
#include <map>
#include <string>
#include <vector>
#include "connection/MobileLinkHTTPBridge.hpp"


namespace mobilelink {
  namespace testing {

    typedef struct _sScriptedResponse
    {
      bool bReceived; // false simulates a failure below HTTP
      long iHTTPCode;
      std::string szBody;
    } scriptedResponse;

    typedef struct _sRecordedRequest
    {
      std::string szMethod;
      std::string szUrl;
      std::string szPostdata;
      std::vector<std::string> vHeaders;
    } recordedRequest;


/*
 * Responses are queued per url without its query string. The last queued
 * response for a url is repeated once the others are used up. A url with
 * nothing queued behaves like an unreachable host.
 */
class FakeHTTPBridge : public MobileLinkHTTPBridge
{
public:
	void add_response(const std::string &szUrl, const long iHTTPCode, const std::string &szBody)
	{
		scriptedResponse response;
		response.bReceived = true;
		response.iHTTPCode = iHTTPCode;
		response.szBody = szBody;
		m_mResponses[strip_query(szUrl)].push_back(response);
	}

	void add_failure(const std::string &szUrl)
	{
		scriptedResponse response;
		response.bReceived = false;
		response.iHTTPCode = 0;
		m_mResponses[strip_query(szUrl)].push_back(response);
	}

	bool SafeGET(const std::string &szUrl, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode) override
	{
		return reply("GET", szUrl, "", vExtraHeaders, szResponse, iHTTPCode);
	}

	bool SafePOST(const std::string &szUrl, const std::string &szPostdata, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode) override
	{
		return reply("POST", szUrl, szPostdata, vExtraHeaders, szResponse, iHTTPCode);
	}

	size_t count_requests(const std::string &szUrl)
	{
		size_t count = 0;
		std::string szKey = strip_query(szUrl);
		for (size_t i = 0; i < m_vRequests.size(); i++)
		{
			if (strip_query(m_vRequests[i].szUrl) == szKey)
				count++;
		}
		return count;
	}

	static bool has_header(const recordedRequest &request, const std::string &szHeader)
	{
		for (size_t i = 0; i < request.vHeaders.size(); i++)
		{
			if (request.vHeaders[i] == szHeader)
				return true;
		}
		return false;
	}

	static std::string strip_query(const std::string &szUrl)
	{
		return szUrl.substr(0, szUrl.find('?'));
	}

public:
	std::vector<recordedRequest> m_vRequests;

private:
	bool reply(const std::string &szMethod, const std::string &szUrl, const std::string &szPostdata, const std::vector<std::string> &vExtraHeaders, std::string &szResponse, long &iHTTPCode)
	{
		recordedRequest request;
		request.szMethod = szMethod;
		request.szUrl = szUrl;
		request.szPostdata = szPostdata;
		request.vHeaders = vExtraHeaders;
		m_vRequests.push_back(request);

		std::vector<std::string> vHeaderData;
		std::map<std::string, std::deque<scriptedResponse> >::iterator it = m_mResponses.find(strip_query(szUrl));
		if ((it == m_mResponses.end()) || it->second.empty())
		{
			iHTTPCode = 0;
			vHeaderData.push_back("CURLE 6 Couldn't resolve host name");
			return ProcessResponse(szResponse, vHeaderData, false);
		}

		scriptedResponse response = it->second.front();
		if (it->second.size() > 1)
			it->second.pop_front();

		if (!response.bReceived)
		{
			iHTTPCode = 0;
			vHeaderData.push_back("CURLE 28 Timeout was reached");
			return ProcessResponse(szResponse, vHeaderData, false);
		}
		iHTTPCode = response.iHTTPCode;
		szResponse = response.szBody;
		return ProcessResponse(szResponse, vHeaderData, true);
	}

private:
	std::map<std::string, std::deque<scriptedResponse> > m_mResponses;
};

  }; // namespace testing
}; // namespace mobilelink
