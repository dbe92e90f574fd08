/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Credentials and session state for the MobileLink client
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "session.hpp"
#include "../mobilelinkclient/API.hpp"


namespace mobilelink {

  namespace auth {

mobilelink::auth::credential username_password(const std::string &szUsername, const std::string &szPassword)
{
	mobilelink::auth::credential result = mobilelink::auth::credential();
	result.eMethod = mobilelink::auth::method::USERNAME_PASSWORD;
	result.szUsername = szUsername;
	result.szPassword = szPassword;
	return result;
}

mobilelink::auth::credential cookies(const std::string &szCookies, const std::string &szUsername, const std::string &szPassword)
{
	mobilelink::auth::credential result = mobilelink::auth::credential();
	result.eMethod = mobilelink::auth::method::COOKIES;
	result.szCookies = szCookies;
	result.szUsername = szUsername;
	result.szPassword = szPassword;
	return result;
}

mobilelink::auth::credential token(const std::string &szToken)
{
	mobilelink::auth::credential result = mobilelink::auth::credential();
	result.eMethod = mobilelink::auth::method::TOKEN;
	result.szToken = szToken;
	return result;
}

  }; // namespace auth


  namespace session {

mobilelink::session::state initial_state(const mobilelink::auth::credential &credential)
{
	mobilelink::session::state result = mobilelink::session::state();
	result.eAuthMethod = credential.eMethod;
	result.bLoggedIn = false;

	switch (credential.eMethod)
	{
	case mobilelink::auth::method::TOKEN:
		result.mHeaders["Host"] = mobilelink::API::header::host;
		result.mHeaders["Accept"] = mobilelink::API::header::jsonAccept;
		result.mHeaders["Authorization"] = "Bearer " + credential.szToken;
		result.mHeaders["User-Agent"] = mobilelink::API::header::appUserAgent;
		result.mHeaders["Accept-Language"] = mobilelink::API::header::language;
		// bearer tokens are issued by the app and never checked
		result.bLoggedIn = true;
		break;
	case mobilelink::auth::method::COOKIES:
		result.mHeaders["User-Agent"] = mobilelink::API::header::browserUserAgent;
		result.mHeaders["Accept"] = mobilelink::API::header::browserAccept;
		result.mHeaders["Accept-Language"] = mobilelink::API::header::language;
		result.mHeaders["Connection"] = "keep-alive";
		result.mHeaders["Cookie"] = credential.szCookies;
		break;
	case mobilelink::auth::method::USERNAME_PASSWORD:
		result.mHeaders["User-Agent"] = mobilelink::API::header::browserUserAgent;
		result.mHeaders["Accept"] = mobilelink::API::header::browserAccept;
		result.mHeaders["Accept-Language"] = mobilelink::API::header::language;
		result.mHeaders["Connection"] = "keep-alive";
		break;
	}
	return result;
}


std::vector<std::string> request_headers(const mobilelink::session::state &session, const bool bWithCsrf)
{
	std::vector<std::string> vHeaders;
	std::map<std::string, std::string>::const_iterator itt;
	for (itt = session.mHeaders.begin(); itt != session.mHeaders.end(); ++itt)
		vHeaders.push_back(itt->first + ": " + itt->second);
	if (bWithCsrf && !session.szCsrfToken.empty())
		vHeaders.push_back(mobilelink::API::header::csrf + ": " + session.szCsrfToken);
	return vHeaders;
}

  }; // namespace session

}; // namespace mobilelink

