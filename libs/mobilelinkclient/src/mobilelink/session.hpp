/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Credentials and session state for the MobileLink client
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <map>
#include <string>
#include <vector>


namespace mobilelink {

  namespace auth {

    namespace method {
	enum value
	{
		USERNAME_PASSWORD = 0,
		COOKIES,
		TOKEN
	};

	static const std::string name[3] = {"username_password", "cookies", "token"};
    }; // namespace method

    /*
     * Exactly one method is in use. A COOKIES credential may also carry a
     * username and password to sign in with once the cookies are rejected.
     */
    typedef struct _sCredential
    {
      mobilelink::auth::method::value eMethod;
      std::string szUsername;
      std::string szPassword;
      std::string szCookies;
      std::string szToken;
    } credential;

    mobilelink::auth::credential username_password(const std::string &szUsername, const std::string &szPassword);
    mobilelink::auth::credential cookies(const std::string &szCookies, const std::string &szUsername = "", const std::string &szPassword = "");
    mobilelink::auth::credential token(const std::string &szToken);

  }; // namespace auth


  namespace session {

    typedef struct _sState
    {
      mobilelink::auth::method::value eAuthMethod;
      std::map<std::string, std::string> mHeaders;
      std::string szCsrfToken; // empty until the sign-in page provided one
      bool bLoggedIn;
    } state;

    mobilelink::session::state initial_state(const mobilelink::auth::credential &credential);

    // "Name: value" lines as passed to curl, X-Csrf-Token appended if known
    std::vector<std::string> request_headers(const mobilelink::session::state &session, const bool bWithCsrf = true);

  }; // namespace session

}; // namespace mobilelink

