/*
 * Copyright (c) 2016-2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Json client for Generac MobileLink API
 *
 * Sign-in sequence against the Azure B2C login pages
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <string>
#include <utility>
#include <vector>

#include "API.hpp"
#include "mobilelinkclient.hpp"
#include "../common/Logger.hpp"
#include "../connection/MobileLinkHTTPBridge.hpp"
#include "../mobilelink/jsoncppbridge.hpp"
#include "../mobilelink/signinpage.hpp"


#define FORM_CONTENT_TYPE "Content-Type: application/x-www-form-urlencoded"


/* private */ std::string MobileLinkClient::get_transaction_query(const std::string &szTransId)
{
	std::string szQuery = "tx=";
	szQuery.append(MobileLinkHTTPBridge::URLEncode(mobilelink::API::signin::transactionPrefix + szTransId));
	szQuery.append("&p=");
	szQuery.append(mobilelink::API::signin::policy);
	return szQuery;
}


/*
 * Post the hidden state/code form if the page carries one. bSubmitted
 * tells whether a form was found; not finding one is not an error here.
 */
/* private */ mobilelink::result::value MobileLinkClient::submit_final_form(const std::string &szPage, bool &bSubmitted)
{
	bSubmitted = false;
	mobilelink::html::finalForm form = mobilelink::html::finalForm();
	if (!mobilelink::html::extract_final_form(szPage, form))
		return mobilelink::result::OK;

	std::vector<std::pair<std::string, std::string> > vFields;
	vFields.push_back(std::make_pair("state", form.szState));
	vFields.push_back(std::make_pair("code", form.szCode));

	std::vector<std::string> vHeaders = mobilelink::session::request_headers(m_session);
	vHeaders.push_back(FORM_CONTENT_TYPE);

	_log.Debug(DEBUG_AUTH, "MobileLink: posting sign-in form to %s", form.szAction.c_str());
	if (!m_pHTTP->SafePOST(form.szAction, MobileLinkHTTPBridge::FormEncode(vFields), vHeaders, m_szResponse, m_iHTTPCode))
	{
		set_transport_error("Sign-in form submit");
		return mobilelink::result::TRANSPORT_ERROR;
	}
	if (m_iHTTPCode != 200)
	{
		m_szLastError = "Bad api login response: ";
		m_szLastError.append(std::to_string(m_iHTTPCode));
		return mobilelink::result::TRANSPORT_ERROR;
	}
	bSubmitted = true;
	return mobilelink::result::OK;
}


/* private */ mobilelink::result::value MobileLinkClient::submit_self_asserted(const std::string &szTransId)
{
	std::string szUrl = mobilelink::API::signin::selfAsserted;
	szUrl.append("?");
	szUrl.append(get_transaction_query(szTransId));

	std::vector<std::pair<std::string, std::string> > vFields;
	vFields.push_back(std::make_pair("request_type", "RESPONSE"));
	vFields.push_back(std::make_pair("signInName", m_credential.szUsername));
	vFields.push_back(std::make_pair("password", m_credential.szPassword));

	std::vector<std::string> vHeaders = mobilelink::session::request_headers(m_session);
	vHeaders.push_back(FORM_CONTENT_TYPE);

	if (!m_pHTTP->SafePOST(szUrl, MobileLinkHTTPBridge::FormEncode(vFields), vHeaders, m_szResponse, m_iHTTPCode))
	{
		set_transport_error("SelfAsserted");
		return mobilelink::result::TRANSPORT_ERROR;
	}
	if (m_iHTTPCode != 200)
	{
		m_szLastError = "SelfAsserted: Bad response status: ";
		m_szLastError.append(std::to_string(m_iHTTPCode));
		return mobilelink::result::TRANSPORT_ERROR;
	}

	Json::Value jResponse;
	if ((mobilelink::parse_json_string(m_szResponse, jResponse) < 0) || !jResponse.isObject() || !jResponse.isMember("status"))
	{
		m_szLastError = mobilelink::messages::invalidSelfAsserted;
		_log.Debug(DEBUG_AUTH, "MobileLink: unexpected SelfAsserted response:\n%s", m_szResponse.c_str());
		return mobilelink::result::CONFIG_PARSE_ERROR;
	}

	if (mobilelink::get_json_string(jResponse, "status") != "200")
	{
		m_szLastError = mobilelink::messages::invalidCredentials;
		std::string szMessage = mobilelink::get_json_string(jResponse, "message");
		if (!szMessage.empty())
		{
			m_szLastError.append(": ");
			m_szLastError.append(szMessage);
		}
		return mobilelink::result::INVALID_CREDENTIALS;
	}
	return mobilelink::result::OK;
}


/* private */ mobilelink::result::value MobileLinkClient::confirm_sign_in(const std::string &szTransId)
{
	std::string szUrl = mobilelink::API::signin::confirmed;
	szUrl.append("?csrf_token=");
	szUrl.append(MobileLinkHTTPBridge::URLEncode(m_session.szCsrfToken));
	szUrl.append("&");
	szUrl.append(get_transaction_query(szTransId));

	if (!m_pHTTP->SafeGET(szUrl, mobilelink::session::request_headers(m_session), m_szResponse, m_iHTTPCode))
	{
		set_transport_error("CombinedSigninAndSignup");
		return mobilelink::result::TRANSPORT_ERROR;
	}
	if (m_iHTTPCode != 200)
	{
		m_szLastError = "CombinedSigninAndSignup: Bad response status: ";
		m_szLastError.append(std::to_string(m_iHTTPCode));
		return mobilelink::result::TRANSPORT_ERROR;
	}

	std::string szConfirmPage = m_szResponse;
	bool bSubmitted = false;
	mobilelink::result::value res = submit_final_form(szConfirmPage, bSubmitted);
	if (res != mobilelink::result::OK)
		return res;
	if (!bSubmitted)
	{
		m_szLastError = mobilelink::messages::missingForm;
		_log.Debug(DEBUG_AUTH, "MobileLink: no sign-in form in page:\n%s", szConfirmPage.c_str());
		return mobilelink::result::CONFIG_PARSE_ERROR;
	}
	return mobilelink::result::OK;
}


/*
 * Full sign-in sequence. If the server still holds a valid session for our
 * cookie jar the very first page already carries the final form and the
 * remaining steps are skipped.
 */
/* private */ mobilelink::result::value MobileLinkClient::sign_in()
{
	m_session.szCsrfToken.clear();

	std::string szUrl = mobilelink::API::signin::start;
	szUrl.append(MobileLinkHTTPBridge::URLEncode(m_credential.szUsername));
	if (!m_pHTTP->SafeGET(szUrl, mobilelink::session::request_headers(m_session, false), m_szResponse, m_iHTTPCode))
	{
		set_transport_error("Sign-in");
		return mobilelink::result::TRANSPORT_ERROR;
	}
	std::string szLoginPage = m_szResponse;

	bool bSubmitted = false;
	mobilelink::result::value res = submit_final_form(szLoginPage, bSubmitted);
	if (res != mobilelink::result::OK)
		return res;
	if (bSubmitted)
	{
		_log.Debug(DEBUG_AUTH, "MobileLink: server session still valid, sign-in form submitted");
		return mobilelink::result::OK;
	}

	std::string szSettings;
	if (!mobilelink::html::extract_settings_json(szLoginPage, szSettings))
	{
		m_szLastError = mobilelink::messages::missingSettings;
		_log.Debug(DEBUG_AUTH, "MobileLink: %s:\n%s", m_szLastError.c_str(), szLoginPage.c_str());
		return mobilelink::result::CONFIG_PARSE_ERROR;
	}

	Json::Value jSettings;
	if ((mobilelink::parse_json_string(szSettings, jSettings) < 0) || !jSettings.isObject())
	{
		m_szLastError = mobilelink::messages::invalidSettings;
		_log.Debug(DEBUG_AUTH, "MobileLink: %s: %s", m_szLastError.c_str(), szSettings.c_str());
		return mobilelink::result::CONFIG_PARSE_ERROR;
	}

	std::string szCsrf = mobilelink::get_json_string(jSettings, "csrf");
	std::string szTransId = mobilelink::get_json_string(jSettings, "transId");
	if (szCsrf.empty() || szTransId.empty())
	{
		m_szLastError = mobilelink::messages::missingCsrf;
		_log.Debug(DEBUG_AUTH, "MobileLink: %s: %s", m_szLastError.c_str(), szSettings.c_str());
		return mobilelink::result::CONFIG_PARSE_ERROR;
	}
	m_session.szCsrfToken = szCsrf;

	res = submit_self_asserted(szTransId);
	if (res != mobilelink::result::OK)
		return res;
	return confirm_sign_in(szTransId);
}

