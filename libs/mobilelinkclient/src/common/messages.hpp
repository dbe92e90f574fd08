/*
 * Copyright (c) 2016-2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Messages and result codes for the MobileLink client
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>


namespace mobilelink {

  namespace result {
	enum value
	{
		OK = 0,
		NO_DATA,
		SESSION_EXPIRED,
		INVALID_CREDENTIALS,
		CONFIG_PARSE_ERROR,
		TRANSPORT_ERROR
	};

	static const std::string name[6] = {"OK", "NoData", "SessionExpired", "InvalidCredentials", "ConfigParseError", "TransportError"};
  }; // namespace result


  namespace messages {

    static const std::string invalidResponse = "Failed to parse server response as JSON";
    static const std::string unexpectedList = "Apparatus list is not a JSON array";
    static const std::string unexpectedApparatus = "Apparatus list entry lacks a numeric apparatusId or type";
    static const std::string unexpectedDetail = "Apparatus detail is not a JSON object";
    static const std::string missingCredentials = "Username and password required for login";
    static const std::string cookiesRejected = "Cookies were not accepted and no username/password is configured";
    static const std::string invalidCredentials = "Sign-in rejected the username/password";
    static const std::string missingSettings = "Unable to find csrf token in login page";
    static const std::string invalidSettings = "Failed to parse sign-in settings as JSON";
    static const std::string missingCsrf = "Missing csrf and/or transId in sign-in settings";
    static const std::string invalidSelfAsserted = "SelfAsserted response lacks a status";
    static const std::string missingForm = "Error parsing HTML submit form";
    static const std::string sessionExpired = "Session expired again after renewing the login";

  }; // namespace messages

}; // namespace mobilelink

