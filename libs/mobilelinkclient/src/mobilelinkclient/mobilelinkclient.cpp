/*
 * Copyright (c) 2016-2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Json client for Generac MobileLink API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <iomanip>
#include <sstream>
#include <string>

#include "API.hpp"
#include "mobilelinkclient.hpp"
#include "../common/Logger.hpp"
#include "../connection/MobileLinkHTTPBridge.hpp"
#include "../mobilelink/jsoncppbridge.hpp"


#define MAX_FETCH_PASSES 2


/*
 * Class construct
 */
MobileLinkClient::MobileLinkClient(const mobilelink::auth::credential &credential) :
	m_credential(credential),
	m_pHTTP(std::make_shared<MobileLinkHTTPBridge>())
{
	init();
}


MobileLinkClient::MobileLinkClient(const mobilelink::auth::credential &credential, std::shared_ptr<MobileLinkHTTPBridge> httpBridge) :
	m_credential(credential),
	m_pHTTP(httpBridge)
{
	init();
}


MobileLinkClient::~MobileLinkClient()
{
	cleanup();
}


/*
 * Initialize
 */
/* private */ void MobileLinkClient::init()
{
	m_session = mobilelink::session::initial_state(m_credential);
	m_iHTTPCode = 0;
	m_szEmptyFieldResponse = "<null>";
}


/*
 * Cleanup curl web client
 */
void MobileLinkClient::cleanup()
{
	MobileLinkHTTPBridge::CloseConnection();
}


std::string MobileLinkClient::get_last_error()
{
	return m_szLastError;
}


std::string MobileLinkClient::get_last_response()
{
	return m_szResponse;
}


void MobileLinkClient::set_empty_field_response(std::string szResponse)
{
	m_szEmptyFieldResponse = szResponse;
}


/* private */ void MobileLinkClient::set_transport_error(const std::string &szContext)
{
	m_szLastError = szContext;
	m_szLastError.append(" failed");

	// the bridge replaced the response with a {"code","message"} object
	Json::Value jError;
	if ((mobilelink::parse_json_string(m_szResponse, jError) == 0) && jError.isObject())
	{
		m_szLastError.append(": ");
		m_szLastError.append(mobilelink::get_json_string(jError, "message"));
		m_szLastError.append(" (CURLE ");
		m_szLastError.append(mobilelink::get_json_string(jError, "code"));
		m_szLastError.append(")");
	}
}


/************************************************************************
 *									*
 *	Session state							*
 *									*
 ************************************************************************/


bool MobileLinkClient::is_logged_in()
{
	return m_session.bLoggedIn;
}


const mobilelink::session::state &MobileLinkClient::get_session_state()
{
	return m_session;
}


/* private */ void MobileLinkClient::invalidate_session()
{
	m_session.bLoggedIn = false;
	m_session.szCsrfToken.clear();
}


/************************************************************************
 *									*
 *	Endpoint fetcher						*
 *									*
 ************************************************************************/


/* private */ mobilelink::result::value MobileLinkClient::get_endpoint(const std::string &szPath, Json::Value &jResponse)
{
	jResponse = Json::Value();
	std::string szUrl = mobilelink::API::uri::base + szPath;
	std::vector<std::string> vHeaders = mobilelink::session::request_headers(m_session);

	if (!m_pHTTP->SafeGET(szUrl, vHeaders, m_szResponse, m_iHTTPCode))
	{
		set_transport_error("GET " + szPath);
		return mobilelink::result::TRANSPORT_ERROR;
	}

	if (m_iHTTPCode == 204)
	{
		_log.Debug(DEBUG_RECEIVED, "getEndpoint %s returned no data", szPath.c_str());
		return mobilelink::result::NO_DATA;
	}

	// the API answers every rejected session with some non 200 status
	if (m_iHTTPCode != 200)
	{
		m_szLastError = "API returned status code: ";
		m_szLastError.append(std::to_string(m_iHTTPCode));
		_log.Debug(DEBUG_RECEIVED, "getEndpoint %s returned HTTP %ld", szPath.c_str(), m_iHTTPCode);
		return mobilelink::result::SESSION_EXPIRED;
	}

	if (mobilelink::parse_json_string(m_szResponse, jResponse) < 0)
	{
		m_szLastError = mobilelink::messages::invalidResponse;
		_log.Debug(DEBUG_RECEIVED, "getEndpoint %s returned invalid json:\n%s", szPath.c_str(), m_szResponse.c_str());
		return mobilelink::result::TRANSPORT_ERROR;
	}

	_log.Debug(DEBUG_RECEIVED, "getEndpoint %s %s", szPath.c_str(), m_szResponse.c_str());
	if (jResponse.isNull())
		return mobilelink::result::NO_DATA;
	return mobilelink::result::OK;
}


/************************************************************************
 *									*
 *	MobileLink authentication					*
 *									*
 ************************************************************************/


mobilelink::result::value MobileLinkClient::login()
{
	switch (m_credential.eMethod)
	{
	case mobilelink::auth::method::TOKEN:
		m_session.bLoggedIn = true;
		return mobilelink::result::OK;

	case mobilelink::auth::method::COOKIES:
	{
		Json::Value jCheck;
		mobilelink::result::value check = get_endpoint(mobilelink::API::uri::apparatusList, jCheck);
		if (check == mobilelink::result::OK)
		{
			m_session.bLoggedIn = true;
			return mobilelink::result::OK;
		}
		if (check == mobilelink::result::TRANSPORT_ERROR)
			return check;

		_log.Log(LOG_STATUS, "MobileLink: browser cookies were not accepted (%s)", mobilelink::result::name[check].c_str());
		if (m_credential.szUsername.empty() || m_credential.szPassword.empty())
		{
			m_szLastError = mobilelink::messages::cookiesRejected;
			return mobilelink::result::INVALID_CREDENTIALS;
		}
		break;
	}

	case mobilelink::auth::method::USERNAME_PASSWORD:
		if (m_credential.szUsername.empty() || m_credential.szPassword.empty())
		{
			m_szLastError = mobilelink::messages::missingCredentials;
			return mobilelink::result::INVALID_CREDENTIALS;
		}
		break;
	}

	mobilelink::result::value res = sign_in();
	if (res != mobilelink::result::OK)
		return res;

	// from here on the cookie jar holds the session
	m_session.mHeaders.erase("Cookie");
	m_session.bLoggedIn = true;
	_log.Log(LOG_STATUS, "MobileLink: signed in");
	return mobilelink::result::OK;
}


/************************************************************************
 *									*
 *	MobileLink device retrieval					*
 *									*
 ************************************************************************/


/* private */ mobilelink::result::value MobileLinkClient::get_apparatus_list(Json::Value &jApparatusList)
{
	mobilelink::result::value res = get_endpoint(mobilelink::API::uri::apparatusList, jApparatusList);
	if (res == mobilelink::result::NO_DATA)
	{
		_log.Debug(DEBUG_NORM, "MobileLink: no data from %s, trying %s", mobilelink::API::uri::apparatusList.c_str(), mobilelink::API::uri::apparatusListV2.c_str());
		res = get_endpoint(mobilelink::API::uri::apparatusListV2, jApparatusList);
	}
	if (res == mobilelink::result::NO_DATA)
		_log.Debug(DEBUG_NORM, "MobileLink: Could not decode apparatuses response");
	return res;
}


/* private */ mobilelink::result::value MobileLinkClient::get_apparatus_detail(const std::string &szApparatusId, Json::Value &jDetail)
{
	std::string szPath = mobilelink::API::uri::get_path(mobilelink::API::uri::apparatusDetail, szApparatusId);
	mobilelink::result::value res = get_endpoint(szPath, jDetail);
	if (res == mobilelink::result::NO_DATA)
	{
		szPath = mobilelink::API::uri::get_path(mobilelink::API::uri::apparatusDetailV1, szApparatusId);
		_log.Debug(DEBUG_NORM, "MobileLink: no details for apparatus %s, trying %s", szApparatusId.c_str(), szPath.c_str());
		res = get_endpoint(szPath, jDetail);
	}
	return res;
}


/* private */ mobilelink::result::value MobileLinkClient::get_generator_data(std::map<std::string, mobilelink::device::item> &mItems)
{
	Json::Value jApparatusList;
	mobilelink::result::value res = get_apparatus_list(jApparatusList);
	if (res != mobilelink::result::OK)
		return res;

	if (!jApparatusList.isArray())
	{
		m_szLastError = mobilelink::messages::unexpectedList;
		_log.Log(LOG_ERROR, "MobileLink: %s", m_szLastError.c_str());
		_log.Debug(DEBUG_RECEIVED, "MobileLink: apparatus list response %s", jApparatusList.toStyledString().c_str());
		return mobilelink::result::TRANSPORT_ERROR;
	}

	for (Json::ArrayIndex i = 0; i < jApparatusList.size(); ++i)
	{
		mobilelink::device::apparatus newapparatus = mobilelink::device::apparatus();
		if (!mobilelink::device::parse_apparatus(jApparatusList[i], newapparatus))
		{
			m_szLastError = mobilelink::messages::unexpectedApparatus;
			return mobilelink::result::TRANSPORT_ERROR;
		}

		if (newapparatus.type != mobilelink::device::type::generator)
		{
			_log.Debug(DEBUG_NORM, "MobileLink: Unknown apparatus type %d %s", newapparatus.type, newapparatus.szName.c_str());
			continue;
		}

		std::string szApparatusId = std::to_string(newapparatus.apparatusId);
		Json::Value jDetail;
		res = get_apparatus_detail(szApparatusId, jDetail);
		if (res == mobilelink::result::SESSION_EXPIRED)
			return res;
		if (res == mobilelink::result::NO_DATA)
		{
			_log.Debug(DEBUG_NORM, "MobileLink: no details for apparatus %s on any API version", szApparatusId.c_str());
			continue;
		}
		if (res != mobilelink::result::OK)
		{
			_log.Log(LOG_ERROR, "MobileLink: skipping apparatus %s: %s", szApparatusId.c_str(), m_szLastError.c_str());
			continue;
		}

		mobilelink::device::item newitem = mobilelink::device::item();
		newitem.apparatus = newapparatus;
		if (!mobilelink::device::parse_apparatus_detail(jDetail, newitem.detail))
		{
			_log.Log(LOG_ERROR, "MobileLink: skipping apparatus %s: %s", szApparatusId.c_str(), mobilelink::messages::unexpectedDetail.c_str());
			continue;
		}
		mItems[szApparatusId] = newitem;
	}
	return mobilelink::result::OK;
}


mobilelink::result::value MobileLinkClient::fetch_device_data()
{
	std::map<std::string, mobilelink::device::item> mItems;
	for (int pass = 0; pass < MAX_FETCH_PASSES; pass++)
	{
		mobilelink::result::value res;
		if (!m_session.bLoggedIn)
		{
			res = login();
			if (res != mobilelink::result::OK)
				return res;
		}

		std::map<std::string, mobilelink::device::item>().swap(mItems);
		res = get_generator_data(mItems);
		if (res == mobilelink::result::SESSION_EXPIRED)
		{
			_log.Log(LOG_STATUS, "MobileLink: session expired (%s)", m_szLastError.c_str());
			invalidate_session();
			continue;
		}

		if (res == mobilelink::result::OK)
			m_mItems.swap(mItems);
		else if (res == mobilelink::result::NO_DATA)
			std::map<std::string, mobilelink::device::item>().swap(m_mItems);
		return res;
	}

	m_szLastError = mobilelink::messages::sessionExpired;
	_log.Log(LOG_ERROR, "MobileLink: %s", m_szLastError.c_str());
	return mobilelink::result::SESSION_EXPIRED;
}


/************************************************************************
 *									*
 *	Return Data Fields						*
 *									*
 ************************************************************************/


mobilelink::device::item *MobileLinkClient::get_item_by_ID(const std::string szApparatusId)
{
	std::map<std::string, mobilelink::device::item>::iterator it = m_mItems.find(szApparatusId);
	if (it == m_mItems.end())
		return nullptr;
	return &it->second;
}


std::string MobileLinkClient::get_property_value(const std::string szApparatusId, const std::vector<int> &vTypeCodes)
{
	return get_property_value(get_item_by_ID(szApparatusId), vTypeCodes);
}


/*
 * Codes are tried one at a time in the given order, so a value for the
 * newer code always takes precedence over the older one.
 */
std::string MobileLinkClient::get_property_value(const mobilelink::device::item *item, const std::vector<int> &vTypeCodes)
{
	if (item == nullptr)
		return m_szEmptyFieldResponse;

	const std::vector<mobilelink::device::property> &properties = item->detail.properties;
	std::vector<int>::const_iterator code;
	for (code = vTypeCodes.begin(); code != vTypeCodes.end(); ++code)
	{
		std::vector<mobilelink::device::property>::const_iterator prop;
		for (prop = properties.begin(); prop != properties.end(); ++prop)
		{
			if ((prop->type != *code) || prop->jValue.isNull())
				continue;
			if (prop->jValue.isString() || prop->jValue.isIntegral() || prop->jValue.isBool())
				return prop->jValue.asString();
			if (prop->jValue.isDouble())
			{
				std::ostringstream ss;
				ss << std::setprecision(15) << prop->jValue.asDouble();
				return ss.str();
			}
		}
	}
	return m_szEmptyFieldResponse;
}

